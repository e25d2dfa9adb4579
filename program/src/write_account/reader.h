#pragma once

#include "write_account.h"

#ifdef __cplusplus
extern "C" {
#endif

// validate a chunk account passed to the executing (target) program
// and on success point payload at its total_len_ finalized bytes.
//
// owner is the owner of the account as reported by the runtime and
// write_program the id of the write-account program. writer may be NULL
// when the calling convention does not require a specific uploader.
// On any failure payload and payload_len are left untouched and the
// caller must reject the invocation.
static inline uint64_t cw_read_chunked_input(
    const uint8_t       *data,
    uint64_t             data_len,
    const cw_pub_key_t  *owner,
    const cw_pub_key_t  *write_program,
    const cw_pub_key_t  *program_id,
    const cw_pub_key_t  *writer,
    const uint8_t      **payload,
    uint64_t            *payload_len )
{
  // buffers not written through the write-account program are never
  // trusted even if their contents look like a chunk account
  if ( !cw_pub_key_equal( owner, write_program ) ) {
    return CW_ERR_INCORRECT_OWNER;
  }
  if ( data_len < CW_HDR_SIZE ) {
    return CW_ERR_ACCOUNT_SIZE;
  }
  const cw_acc_hdr_t *hdr = (const cw_acc_hdr_t*)data;
  if ( hdr->magic_ != CW_MAGIC || hdr->ver_ != CW_VERSION ) {
    return CW_ERR_UNRECOGNIZED_VERSION;
  }
  if ( !cw_pub_key_equal( &hdr->target_, program_id ) ) {
    return CW_ERR_WRONG_TARGET_PROGRAM;
  }
  if ( hdr->written_ != hdr->total_len_ ) {
    return CW_ERR_INCOMPLETE;
  }
  if ( hdr->total_len_ > data_len - CW_HDR_SIZE ) {
    return CW_ERR_ACCOUNT_SIZE;
  }
  if ( writer && !cw_pub_key_equal( &hdr->writer_, writer ) ) {
    return CW_ERR_WRITER_MISMATCH;
  }
  *payload     = &data[CW_HDR_SIZE];
  *payload_len = hdr->total_len_;
  return CW_SUCCESS;
}

#ifdef __cplusplus
}
#endif
