#pragma once

/**
 * @file
 *
 * @brief Some ANSI escape sequences.
 *
 * Colouring is compiled in only when `MEMO_COLOR` is defined, so that
 * messages embedded in exceptions stay plain text by default.
 */

namespace memo {

#ifdef MEMO_COLOR
#define ANSI_NORMAL "\e[0m"
#define ANSI_BOLD "\e[1m"
#define ANSI_RED "\e[31;1m"
#define ANSI_GREEN "\e[32;1m"
#define ANSI_WARNING "\e[35;1m"
#define ANSI_BLUE "\e[34;1m"
#else
#define ANSI_NORMAL ""
#define ANSI_BOLD ""
#define ANSI_RED ""
#define ANSI_GREEN ""
#define ANSI_WARNING ""
#define ANSI_BLUE ""
#endif

} // namespace memo
