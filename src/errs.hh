#ifndef GOLDEN_ERRS_HH
#define GOLDEN_ERRS_HH

#define ERR_DRV_ONLY_OPT_INVALID "Argument of '--only' must be one of 'fail', 'pass', 'missing'"
#define ERR_DRV_CMD_OPT_MISSING "No '--cmd' given; don’t know how to run the tests"
#define ERR_DRV_CMD_OPT_NO_FILE "Command '{}' does not contain '%s'; every test would run the same command"
#define ERR_DRV_JOBS_OPT_INVALID "Argument of '-j' must be a positive number"
#define ERR_DRV_REGEX_INVALID "Invalid regular expression '{}': {}"
#define ERR_SAVE_FAILED "Failed to save expectation for '{}': {}"
#endif //GOLDEN_ERRS_HH
