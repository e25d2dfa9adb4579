#ifndef _cw_write_account_util_compat_stdint_h_
#define _cw_write_account_util_compat_stdint_h_

/* solana uses its own definitions for stdint types and that can cause
   problems when the same headers are compiled for the host */

#ifdef __bpf__
#include <solana_sdk.h>
#else
#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>
#endif

#endif /* _cw_write_account_util_compat_stdint_h_ */
