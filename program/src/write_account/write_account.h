#pragma once

#include "util/compat_stdint.h"

#ifdef __cplusplus
extern "C" {
#endif

// magic number at head of chunk account
#define CW_MAGIC 0xc4a7b10cU

// current account layout version
#define CW_VERSION            1

// various size constants
#define CW_PUBKEY_SIZE       32
#define CW_PUBKEY_SIZE_64   (CW_PUBKEY_SIZE/sizeof(uint64_t))
#define CW_HDR_SIZE          88
#define CW_MAX_ACCOUNT_SIZE (10UL*1024UL*1024UL)
#define CW_MAX_PAYLOAD      (CW_MAX_ACCOUNT_SIZE-CW_HDR_SIZE)

#define CW_PACKED __attribute__((__packed__))

// custom program error codes
typedef enum {
  CW_SUCCESS = 0,

  // protocol errors (deterministic violations of the write protocol)
  CW_ERR_ALREADY_INITIALIZED = 1,
  CW_ERR_CAPACITY_TOO_SMALL,
  CW_ERR_ACCOUNT_SIZE,
  CW_ERR_UNAUTHORIZED,
  CW_ERR_OUT_OF_ORDER_WRITE,
  CW_ERR_OVERFLOW,
  CW_ERR_NOT_INITIALIZED,
  CW_ERR_INVALID_INSTRUCTION,

  // integrity errors (raised when reading a chunk account)
  CW_ERR_UNRECOGNIZED_VERSION,
  CW_ERR_WRONG_TARGET_PROGRAM,
  CW_ERR_INCOMPLETE,
  CW_ERR_WRITER_MISMATCH,
  CW_ERR_INCORRECT_OWNER,

  CW_ERR_LAST
} cw_err_t;

// public key of writer, target program or chunk account
typedef union cw_pub_key
{
  uint8_t  k1_[CW_PUBKEY_SIZE];
  uint64_t k8_[CW_PUBKEY_SIZE_64];
} cw_pub_key_t;

// chunk account header, followed by capacity bytes of payload
typedef struct cw_acc_hdr
{
  uint32_t        magic_;            // chunk account magic number
  uint32_t        ver_;              // account layout version
  cw_pub_key_t    writer_;           // only key allowed to write or close
  cw_pub_key_t    target_;           // program allowed to consume payload
  uint64_t        total_len_;        // declared payload length
  uint64_t        written_;          // contiguous payload bytes written
} cw_acc_hdr_t;

// command enumeration (leading byte of instruction data)
typedef enum {

  // initialize freshly allocated chunk account
  // key[0] writer account        [signer writable]
  // key[1] chunk account         [writable]
  e_cmd_initialize = 0,

  // append payload bytes at the current high-water mark
  // key[0] writer account        [signer]
  // key[1] chunk account         [writable]
  e_cmd_write,

  // release chunk account and return its lamports to the writer
  // key[0] writer account        [signer writable]
  // key[1] chunk account         [writable]
  e_cmd_close

} cw_command_t;

typedef struct cmd_initialize
{
  uint8_t      cmd_;
  uint64_t     capacity_;
  uint64_t     total_len_;
  cw_pub_key_t target_;
} CW_PACKED cmd_initialize_t;

typedef struct cmd_write
{
  uint8_t      cmd_;
  uint64_t     offset_;
  // payload bytes follow
} CW_PACKED cmd_write_t;

typedef struct cmd_close
{
  uint8_t      cmd_;
} CW_PACKED cmd_close_t;

// compare if two pub_keys (accounts) are the same
static inline bool cw_pub_key_equal( const cw_pub_key_t *p1,
                                     const cw_pub_key_t *p2 )
{
  return p1->k8_[0] == p2->k8_[0] &&
         p1->k8_[1] == p2->k8_[1] &&
         p1->k8_[2] == p2->k8_[2] &&
         p1->k8_[3] == p2->k8_[3];
}

// assign one pub_key from another (source may be unaligned)
static inline void cw_pub_key_assign( cw_pub_key_t *tgt, const void *src )
{
  __builtin_memcpy( tgt->k1_, src, CW_PUBKEY_SIZE );
}

// check that no header byte has been set yet
static inline bool cw_hdr_is_zero( const uint8_t *data )
{
  const uint64_t *ptr = (const uint64_t*)data;
  for( unsigned i = 0; i != CW_HDR_SIZE/sizeof(uint64_t); ++i ) {
    if ( ptr[i] ) return false;
  }
  return true;
}

// is header a chunk account of a layout we know how to read
static inline uint64_t cw_hdr_check( const uint8_t *data, uint64_t data_len )
{
  if ( data_len < CW_HDR_SIZE ) {
    return CW_ERR_ACCOUNT_SIZE;
  }
  const cw_acc_hdr_t *hdr = (const cw_acc_hdr_t*)data;
  if ( hdr->magic_ == 0 && hdr->ver_ == 0 ) {
    return CW_ERR_NOT_INITIALIZED;
  }
  if ( hdr->magic_ != CW_MAGIC || hdr->ver_ != CW_VERSION ) {
    return CW_ERR_UNRECOGNIZED_VERSION;
  }
  return CW_SUCCESS;
}

// write header into freshly allocated account of exactly
// CW_HDR_SIZE + capacity bytes
static inline uint64_t cw_initialize( uint8_t                *data,
                                      uint64_t                data_len,
                                      const cw_pub_key_t     *writer,
                                      const cmd_initialize_t *cmd )
{
  if ( data_len < CW_HDR_SIZE ) {
    return CW_ERR_ACCOUNT_SIZE;
  }
  if ( !cw_hdr_is_zero( data ) ) {
    return CW_ERR_ALREADY_INITIALIZED;
  }
  uint64_t capacity  = cmd->capacity_;
  uint64_t total_len = cmd->total_len_;
  if ( capacity < total_len ) {
    return CW_ERR_CAPACITY_TOO_SMALL;
  }
  if ( capacity > CW_MAX_PAYLOAD || data_len != CW_HDR_SIZE + capacity ) {
    return CW_ERR_ACCOUNT_SIZE;
  }
  cw_acc_hdr_t *hdr = (cw_acc_hdr_t*)data;
  hdr->magic_     = CW_MAGIC;
  hdr->ver_       = CW_VERSION;
  hdr->total_len_ = total_len;
  hdr->written_   = 0;
  cw_pub_key_assign( &hdr->writer_, writer );
  cw_pub_key_assign( &hdr->target_, &cmd->target_ );
  return CW_SUCCESS;
}

// append len bytes at offset which must equal the high-water mark
static inline uint64_t cw_write( uint8_t            *data,
                                 uint64_t            data_len,
                                 const cw_pub_key_t *signer,
                                 uint64_t            offset,
                                 const uint8_t      *buf,
                                 uint64_t            len )
{
  uint64_t rc = cw_hdr_check( data, data_len );
  if ( rc != CW_SUCCESS ) {
    return rc;
  }
  cw_acc_hdr_t *hdr = (cw_acc_hdr_t*)data;
  if ( !cw_pub_key_equal( signer, &hdr->writer_ ) ) {
    return CW_ERR_UNAUTHORIZED;
  }
  if ( len == 0 ) {
    return CW_ERR_INVALID_INSTRUCTION;
  }
  if ( offset != hdr->written_ ) {
    return CW_ERR_OUT_OF_ORDER_WRITE;
  }
  // written_ <= total_len_ always holds so this cannot wrap
  if ( len > hdr->total_len_ - hdr->written_ ) {
    return CW_ERR_OVERFLOW;
  }
  if ( hdr->total_len_ > data_len - CW_HDR_SIZE ) {
    return CW_ERR_ACCOUNT_SIZE;
  }
  __builtin_memcpy( &data[CW_HDR_SIZE + offset], buf, len );
  hdr->written_ += len;
  return CW_SUCCESS;
}

// authorize close and wipe account data; caller moves the lamports
static inline uint64_t cw_close( uint8_t            *data,
                                 uint64_t            data_len,
                                 const cw_pub_key_t *signer )
{
  uint64_t rc = cw_hdr_check( data, data_len );
  if ( rc != CW_SUCCESS ) {
    return rc;
  }
  const cw_acc_hdr_t *hdr = (const cw_acc_hdr_t*)data;
  if ( !cw_pub_key_equal( signer, &hdr->writer_ ) ) {
    return CW_ERR_UNAUTHORIZED;
  }
  __builtin_memset( data, 0, data_len );
  return CW_SUCCESS;
}

// decode and apply one write-account instruction against the chunk
// account data. signer is the key[0] account or NULL if it did not sign
static inline uint64_t cw_process( uint8_t            *data,
                                   uint64_t            data_len,
                                   const cw_pub_key_t *signer,
                                   const uint8_t      *ix,
                                   uint64_t            ix_len )
{
  if ( ix_len == 0 ) {
    return CW_ERR_INVALID_INSTRUCTION;
  }
  if ( !signer ) {
    return CW_ERR_UNAUTHORIZED;
  }
  switch( ix[0] ) {
    case e_cmd_initialize: {
      if ( ix_len != sizeof( cmd_initialize_t ) ) {
        return CW_ERR_INVALID_INSTRUCTION;
      }
      return cw_initialize(
          data, data_len, signer, (const cmd_initialize_t*)ix );
    }
    case e_cmd_write: {
      if ( ix_len < sizeof( cmd_write_t ) ) {
        return CW_ERR_INVALID_INSTRUCTION;
      }
      const cmd_write_t *cptr = (const cmd_write_t*)ix;
      return cw_write( data, data_len, signer, cptr->offset_,
                       &ix[sizeof( cmd_write_t )],
                       ix_len - sizeof( cmd_write_t ) );
    }
    case e_cmd_close: {
      if ( ix_len != sizeof( cmd_close_t ) ) {
        return CW_ERR_INVALID_INSTRUCTION;
      }
      return cw_close( data, data_len, signer );
    }
    default:
      return CW_ERR_INVALID_INSTRUCTION;
  }
}

#ifdef __cplusplus
}
#endif
