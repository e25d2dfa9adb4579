#include <write_account/write_account.h>
#include <cw/key_pair.hpp>
#include "test_error.hpp"
#include <stddef.h>
#include <vector>

static_assert( sizeof( cw_acc_hdr_t ) == CW_HDR_SIZE );
static_assert( offsetof( cw_acc_hdr_t, magic_ ) == 0 );
static_assert( offsetof( cw_acc_hdr_t, ver_ ) == 4 );
static_assert( offsetof( cw_acc_hdr_t, writer_ ) == 8 );
static_assert( offsetof( cw_acc_hdr_t, target_ ) == 40 );
static_assert( offsetof( cw_acc_hdr_t, total_len_ ) == 72 );
static_assert( offsetof( cw_acc_hdr_t, written_ ) == 80 );
static_assert( sizeof( cmd_initialize_t ) == 49 );
static_assert( sizeof( cmd_write_t ) == 9 );
static_assert( sizeof( cmd_close_t ) == 1 );

void set_key( cw_pub_key_t *kptr, const cw::pub_key& pk )
{
  cw_pub_key_assign( kptr, pk.data() );
}

void init_cmd( cmd_initialize_t *cmd, uint64_t capacity,
               uint64_t total_len, const cw_pub_key_t *target )
{
  __builtin_memset( cmd, 0, sizeof( cmd_initialize_t ) );
  cmd->cmd_       = e_cmd_initialize;
  cmd->capacity_  = capacity;
  cmd->total_len_ = total_len;
  cw_pub_key_assign( &cmd->target_, target );
}

void test_initialize()
{
  cw::key_pair wkp, tkp;
  wkp.gen();
  tkp.gen();
  cw_pub_key_t writer[1], target[1];
  set_key( writer, cw::pub_key( wkp ) );
  set_key( target, cw::pub_key( tkp ) );

  std::vector<uint8_t> acc( CW_HDR_SIZE + 100, 0 );
  cmd_initialize_t cmd[1];

  // capacity must cover the declared length
  init_cmd( cmd, 100, 101, target );
  CW_TEST_CHECK( CW_ERR_CAPACITY_TOO_SMALL ==
      cw_initialize( acc.data(), acc.size(), writer, cmd ) );

  // account must be exactly header plus capacity
  init_cmd( cmd, 99, 50, target );
  CW_TEST_CHECK( CW_ERR_ACCOUNT_SIZE ==
      cw_initialize( acc.data(), acc.size(), writer, cmd ) );
  init_cmd( cmd, 100, 50, target );
  CW_TEST_CHECK( CW_ERR_ACCOUNT_SIZE ==
      cw_initialize( acc.data(), CW_HDR_SIZE - 1, writer, cmd ) );

  // nothing written by failed attempts
  for( size_t i = 0; i != acc.size(); ++i ) {
    CW_TEST_CHECK( acc[i] == 0 );
  }

  init_cmd( cmd, 100, 50, target );
  CW_TEST_CHECK( CW_SUCCESS ==
      cw_initialize( acc.data(), acc.size(), writer, cmd ) );
  const cw_acc_hdr_t *hdr = (const cw_acc_hdr_t*)acc.data();
  CW_TEST_CHECK( hdr->magic_ == CW_MAGIC );
  CW_TEST_CHECK( hdr->ver_ == CW_VERSION );
  CW_TEST_CHECK( hdr->total_len_ == 50 );
  CW_TEST_CHECK( hdr->written_ == 0 );
  CW_TEST_CHECK( cw_pub_key_equal( &hdr->writer_, writer ) );
  CW_TEST_CHECK( cw_pub_key_equal( &hdr->target_, target ) );

  // no second initialize, not even by the same writer
  CW_TEST_CHECK( CW_ERR_ALREADY_INITIALIZED ==
      cw_initialize( acc.data(), acc.size(), writer, cmd ) );
}

void test_write()
{
  cw::key_pair wkp, okp, tkp;
  wkp.gen();
  okp.gen();
  tkp.gen();
  cw_pub_key_t writer[1], other[1], target[1];
  set_key( writer, cw::pub_key( wkp ) );
  set_key( other, cw::pub_key( okp ) );
  set_key( target, cw::pub_key( tkp ) );

  const uint8_t pay[] = "abcdefghijklmnopqrstuvwxyz";
  std::vector<uint8_t> acc( CW_HDR_SIZE + 26, 0 );

  // write before initialize
  CW_TEST_CHECK( CW_ERR_NOT_INITIALIZED ==
      cw_write( acc.data(), acc.size(), writer, 0, pay, 13 ) );

  cmd_initialize_t cmd[1];
  init_cmd( cmd, 26, 26, target );
  CW_TEST_CHECK( CW_SUCCESS ==
      cw_initialize( acc.data(), acc.size(), writer, cmd ) );
  const cw_acc_hdr_t *hdr = (const cw_acc_hdr_t*)acc.data();

  // foreign signer, empty write, gap and rewind all rejected
  CW_TEST_CHECK( CW_ERR_UNAUTHORIZED ==
      cw_write( acc.data(), acc.size(), other, 0, pay, 13 ) );
  CW_TEST_CHECK( CW_ERR_INVALID_INSTRUCTION ==
      cw_write( acc.data(), acc.size(), writer, 0, pay, 0 ) );
  CW_TEST_CHECK( CW_ERR_OUT_OF_ORDER_WRITE ==
      cw_write( acc.data(), acc.size(), writer, 13, &pay[13], 13 ) );
  CW_TEST_CHECK( hdr->written_ == 0 );

  CW_TEST_CHECK( CW_SUCCESS ==
      cw_write( acc.data(), acc.size(), writer, 0, pay, 13 ) );
  CW_TEST_CHECK( hdr->written_ == 13 );
  CW_TEST_CHECK( CW_ERR_OUT_OF_ORDER_WRITE ==
      cw_write( acc.data(), acc.size(), writer, 0, pay, 13 ) );

  // past declared length
  CW_TEST_CHECK( CW_ERR_OVERFLOW ==
      cw_write( acc.data(), acc.size(), writer, 13, &pay[13], 14 ) );
  CW_TEST_CHECK( hdr->written_ == 13 );

  CW_TEST_CHECK( CW_SUCCESS ==
      cw_write( acc.data(), acc.size(), writer, 13, &pay[13], 13 ) );
  CW_TEST_CHECK( hdr->written_ == 26 );
  CW_TEST_CHECK( 0 == __builtin_memcmp( &acc[CW_HDR_SIZE], pay, 26 ) );

  // complete accounts accept no more writes
  CW_TEST_CHECK( CW_ERR_OVERFLOW ==
      cw_write( acc.data(), acc.size(), writer, 26, pay, 1 ) );

  // unknown layout version
  std::vector<uint8_t> acc2( acc );
  ((cw_acc_hdr_t*)acc2.data())->ver_ = CW_VERSION + 1;
  CW_TEST_CHECK( CW_ERR_UNRECOGNIZED_VERSION ==
      cw_write( acc2.data(), acc2.size(), writer, 26, pay, 1 ) );
}

void test_close()
{
  cw::key_pair wkp, okp, tkp;
  wkp.gen();
  okp.gen();
  tkp.gen();
  cw_pub_key_t writer[1], other[1], target[1];
  set_key( writer, cw::pub_key( wkp ) );
  set_key( other, cw::pub_key( okp ) );
  set_key( target, cw::pub_key( tkp ) );

  std::vector<uint8_t> acc( CW_HDR_SIZE + 8, 0 );
  CW_TEST_CHECK( CW_ERR_NOT_INITIALIZED ==
      cw_close( acc.data(), acc.size(), writer ) );

  cmd_initialize_t cmd[1];
  init_cmd( cmd, 8, 8, target );
  CW_TEST_CHECK( CW_SUCCESS ==
      cw_initialize( acc.data(), acc.size(), writer, cmd ) );
  const uint8_t pay[] = "01234567";
  CW_TEST_CHECK( CW_SUCCESS ==
      cw_write( acc.data(), acc.size(), writer, 0, pay, 4 ) );

  // writing state may be closed by its writer only
  CW_TEST_CHECK( CW_ERR_UNAUTHORIZED ==
      cw_close( acc.data(), acc.size(), other ) );
  CW_TEST_CHECK( CW_SUCCESS == cw_close( acc.data(), acc.size(), writer ) );
  for( size_t i = 0; i != acc.size(); ++i ) {
    CW_TEST_CHECK( acc[i] == 0 );
  }
  CW_TEST_CHECK( CW_ERR_NOT_INITIALIZED ==
      cw_write( acc.data(), acc.size(), writer, 4, &pay[4], 4 ) );
}

void test_process()
{
  cw::key_pair wkp, tkp;
  wkp.gen();
  tkp.gen();
  cw_pub_key_t writer[1], target[1];
  set_key( writer, cw::pub_key( wkp ) );
  set_key( target, cw::pub_key( tkp ) );

  std::vector<uint8_t> acc( CW_HDR_SIZE + 4, 0 );
  cmd_initialize_t init[1];
  init_cmd( init, 4, 4, target );
  const uint8_t *iptr = (const uint8_t*)init;

  // malformed instructions
  CW_TEST_CHECK( CW_ERR_INVALID_INSTRUCTION ==
      cw_process( acc.data(), acc.size(), writer, iptr, 0 ) );
  CW_TEST_CHECK( CW_ERR_INVALID_INSTRUCTION ==
      cw_process( acc.data(), acc.size(), writer, iptr,
                  sizeof( cmd_initialize_t ) - 1 ) );
  uint8_t bad[] = { 7 };
  CW_TEST_CHECK( CW_ERR_INVALID_INSTRUCTION ==
      cw_process( acc.data(), acc.size(), writer, bad, sizeof( bad ) ) );

  // writer must sign
  CW_TEST_CHECK( CW_ERR_UNAUTHORIZED ==
      cw_process( acc.data(), acc.size(), nullptr, iptr,
                  sizeof( cmd_initialize_t ) ) );
  CW_TEST_CHECK( CW_SUCCESS ==
      cw_process( acc.data(), acc.size(), writer, iptr,
                  sizeof( cmd_initialize_t ) ) );

  uint8_t wr[sizeof( cmd_write_t ) + 4];
  cmd_write_t *wcmd = (cmd_write_t*)wr;
  wcmd->cmd_    = e_cmd_write;
  wcmd->offset_ = 0;
  __builtin_memcpy( &wr[sizeof( cmd_write_t )], "wxyz", 4 );
  CW_TEST_CHECK( CW_ERR_INVALID_INSTRUCTION ==
      cw_process( acc.data(), acc.size(), writer, wr,
                  sizeof( cmd_write_t ) - 1 ) );
  CW_TEST_CHECK( CW_SUCCESS ==
      cw_process( acc.data(), acc.size(), writer, wr, sizeof( wr ) ) );
  CW_TEST_CHECK( ((const cw_acc_hdr_t*)acc.data())->written_ == 4 );

  uint8_t cl[] = { e_cmd_close, 0 };
  CW_TEST_CHECK( CW_ERR_INVALID_INSTRUCTION ==
      cw_process( acc.data(), acc.size(), writer, cl, sizeof( cl ) ) );
  CW_TEST_CHECK( CW_SUCCESS ==
      cw_process( acc.data(), acc.size(), writer, cl, 1 ) );
}

int main( int, char** )
{
  CW_TEST_START
  test_initialize();
  test_write();
  test_close();
  test_process();
  CW_TEST_END
  return 0;
}
