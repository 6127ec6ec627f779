#pragma once

/*compile-time knobs, each can be overridden with -D*/

#ifndef POUND_VERSION
#define POUND_VERSION "1.0"
#endif

/*columns between tab stops*/
#ifndef POUND_TAB_STOP
#define POUND_TAB_STOP 8
#endif

/*extra Ctrl-Q presses needed to leave with unsaved changes*/
#ifndef POUND_QUIT_TIMES
#define POUND_QUIT_TIMES 2
#endif

#ifndef POUND_MESSAGE_TIMEOUT_SEC
#define POUND_MESSAGE_TIMEOUT_SEC 5
#endif

/*getch() timeout; the screen is repainted when it expires*/
#ifndef POUND_INPUT_TIMEOUT_MS
#define POUND_INPUT_TIMEOUT_MS 1000
#endif

#ifndef POUND_WRITE_CHUNK_SIZE
#define POUND_WRITE_CHUNK_SIZE (64 * 1024)
#endif

#define POUND_RC_NAME ".poundrc"
