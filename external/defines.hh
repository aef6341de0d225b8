#ifndef BACONSTEGO_DEFINES_HH
#define BACONSTEGO_DEFINES_HH

#define BACON_CLI_RED "\033[31m"
#define BACON_CLI_GREEN "\033[32m"
#define BACON_CLI_YELLOW "\033[33m"

#define BACON_CLI_RESET "\033[0m"

#endif //BACONSTEGO_DEFINES_HH
