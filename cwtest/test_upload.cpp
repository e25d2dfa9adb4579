#include <cw/uploader.hpp>
#include <cw/log.hpp>
#include <write_account/reader.h>
#include "sim_ledger.hpp"
#include "test_error.hpp"
#include <thread>
#include <vector>

using namespace cw;

static const uint64_t init_balance = 1000000000000UL;

// cluster with a funded writer and a deployed write-account program
struct upload_env
{
  upload_env();
  void init_uploader( uploader& );

  sim_ledger sim_;
  key_pair   wkey_;
  pub_key    wpub_;
  pub_key    gpub_;
  pub_key    target_;
};

upload_env::upload_env()
{
  key_pair gkey, tkey;
  wkey_.gen();
  gkey.gen();
  tkey.gen();
  wpub_ = pub_key( wkey_ );
  gpub_ = pub_key( gkey );
  target_ = pub_key( tkey );
  sim_.set_program_id( gpub_ );
  sim_.fund( wpub_, init_balance );
}

void upload_env::init_uploader( uploader& upl )
{
  upl.set_ledger( &sim_ );
  upl.set_writer( &wkey_ );
  upl.set_program_id( gpub_ );
  upl.set_retry_delay( 0 );
}

std::vector<uint8_t> make_payload( size_t len )
{
  const char *txt = "abcdefghijklmnopqrstuvwxyz";
  std::vector<uint8_t> res( len );
  for( size_t i = 0; i != len; ++i ) {
    res[i] = txt[i % 26];
  }
  return res;
}

// payload as seen by the target program
bool read_back( upload_env& env, const upload& u, std::vector<uint8_t>& res )
{
  const account_info *acc = env.sim_.find_account( u.get_chunk_account() );
  if ( !acc ) {
    return false;
  }
  cw_pub_key_t owner[1], wprog[1], target[1], writer[1];
  cw_pub_key_assign( owner, acc->owner_.data() );
  cw_pub_key_assign( wprog, env.gpub_.data() );
  cw_pub_key_assign( target, env.target_.data() );
  cw_pub_key_assign( writer, env.wpub_.data() );
  const uint8_t *pay = nullptr;
  uint64_t pay_len = 0;
  if ( CW_SUCCESS != cw_read_chunked_input( acc->data_.data(),
        acc->data_.size(), owner, wprog, target, writer, &pay, &pay_len ) ) {
    return false;
  }
  res.assign( pay, pay + pay_len );
  return true;
}

void test_tx()
{
  key_pair wkey, ckey, gkey;
  wkey.gen();
  ckey.gen();
  gkey.gen();
  hash bhash;
  std::vector<uint8_t> pay = make_payload( 2000 );

  // largest chunk fills a transaction exactly
  char buf[CW_TX_MAX_SIZE];
  bincode tx( buf );
  CW_TEST_CHECK( tx::write( tx, bhash, wkey, pub_key( ckey ),
      pub_key( gkey ), 0, pay.data(), CW_TX_MAX_SIZE - CW_TX_WRITE_OVERHEAD ) );
  CW_TEST_CHECK( tx.size() == CW_TX_MAX_SIZE );
  bincode tx2( buf );
  CW_TEST_CHECK( !tx::write( tx2, bhash, wkey, pub_key( ckey ),
      pub_key( gkey ), 0, pay.data(),
      CW_TX_MAX_SIZE - CW_TX_WRITE_OVERHEAD + 1 ) );

  // transaction id is the writer signature over the message
  bincode tx3( buf );
  CW_TEST_CHECK( tx::close( tx3, bhash, wkey, pub_key( ckey ),
      pub_key( gkey ) ) );
  signature sig;
  tx::get_signature( tx3, sig );
  size_t msg_off = 1 + signature::len;
  CW_TEST_CHECK( sig.verify( (const uint8_t*)&buf[msg_off],
      tx3.size() - msg_off, pub_key( wkey ) ) );
}

void test_alphabet()
{
  upload_env env;
  uploader upl;
  env.init_uploader( upl );
  CW_TEST_CHECK( upl.set_tx_limit( CW_TX_WRITE_OVERHEAD + 13 ) );

  upload u;
  const char *txt = "abcdefghijklmnopqrstuvwxyz";
  u.set_payload( (const uint8_t*)txt, 26 );
  u.set_target( env.target_ );
  CW_TEST_CHECK( upl.begin_upload( u ) );
  CW_TEST_CHECK( !upl.get_is_err() );
  CW_TEST_CHECK( u.get_has_key() );
  CW_TEST_CHECK( u.get_state() == e_upload_complete );
  CW_TEST_CHECK( u.get_written() == 26 );
  CW_TEST_CHECK( upl.get_num_writes() == 2 );
  CW_TEST_CHECK( upl.get_num_sent() == 3 );
  CW_TEST_CHECK( env.sim_.get_num_writes() == 2 );

  const account_info *acc = env.sim_.find_account( u.get_chunk_account() );
  CW_TEST_CHECK( acc && acc->owner_ == env.gpub_ );
  CW_TEST_CHECK( acc->data_.size() == CW_HDR_SIZE + 26 );
  const cw_acc_hdr_t *hdr = (const cw_acc_hdr_t*)acc->data_.data();
  CW_TEST_CHECK( hdr->written_ == 26 && hdr->total_len_ == 26 );

  std::vector<uint8_t> res;
  CW_TEST_CHECK( read_back( env, u, res ) );
  CW_TEST_CHECK( res == std::vector<uint8_t>( txt, txt + 26 ) );

  // rent is refunded on close
  CW_TEST_CHECK( env.sim_.get_balance( env.wpub_ ) < init_balance );
  CW_TEST_CHECK( upl.status( u ) );
  CW_TEST_CHECK( u.get_state() == e_upload_complete );
  CW_TEST_CHECK( upl.close( u ) );
  CW_TEST_CHECK( u.get_state() == e_upload_closed );
  CW_TEST_CHECK( !env.sim_.find_account( u.get_chunk_account() ) );
  CW_TEST_CHECK( env.sim_.get_balance( env.wpub_ ) == init_balance );
  CW_TEST_CHECK( upl.status( u ) );
  CW_TEST_CHECK( u.get_state() == e_upload_closed );

  // a closed account is never recreated
  CW_TEST_CHECK( !upl.resume( u ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_invalid );
}

void test_large()
{
  upload_env env;
  uploader upl;
  env.init_uploader( upl );

  upload u;
  u.set_payload( make_payload( 26 * 4000 ) );
  u.set_target( env.target_ );
  CW_TEST_CHECK( upl.begin_upload( u ) );

  chunk_plan plan;
  plan.set_payload( u.get_payload().data(), u.get_payload().size() );
  CW_TEST_CHECK( plan.get_num_chunks() == 103 );
  CW_TEST_CHECK( env.sim_.get_num_writes() == plan.get_num_chunks() );
  std::vector<uint8_t> res;
  CW_TEST_CHECK( read_back( env, u, res ) );
  CW_TEST_CHECK( res == u.get_payload() );
}

void test_resume()
{
  upload_env env;
  const size_t num_chunks = 8, num_done = 3;
  std::vector<uint8_t> pay = make_payload( 1019 * num_chunks - 100 );

  // connection lost after create and num_done writes
  upload u;
  u.set_payload( pay );
  u.set_target( env.target_ );
  {
    uploader upl;
    env.init_uploader( upl );
    upl.set_max_retries( 0 );
    env.sim_.set_fail_from( 1 + num_done );
    CW_TEST_CHECK( !upl.begin_upload( u ) );
    CW_TEST_CHECK( upl.get_err_kind() == e_err_transient );
    CW_TEST_CHECK( u.get_state() == e_upload_writing );
    CW_TEST_CHECK( u.get_written() == 1019 * num_done );
    CW_TEST_CHECK( env.sim_.get_num_writes() == num_done );
  }

  // another process picks up from the saved key
  env.sim_.clear_faults();
  upload u2;
  u2.set_payload( pay );
  u2.set_target( env.target_ );
  u2.set_chunk_key_pair( u.get_chunk_key_pair() );

  uploader upl;
  env.init_uploader( upl );
  CW_TEST_CHECK( upl.status( u2 ) );
  CW_TEST_CHECK( u2.get_state() == e_upload_writing );
  CW_TEST_CHECK( u2.get_written() == 1019 * num_done );
  CW_TEST_CHECK( upl.resume( u2 ) );
  CW_TEST_CHECK( upl.get_num_writes() == num_chunks - num_done );
  CW_TEST_CHECK( upl.get_num_sent() == num_chunks - num_done );
  CW_TEST_CHECK( env.sim_.get_num_writes() == num_chunks );
  std::vector<uint8_t> res;
  CW_TEST_CHECK( read_back( env, u2, res ) );
  CW_TEST_CHECK( res == pay );

  // resuming a complete upload sends nothing
  CW_TEST_CHECK( upl.resume( u2 ) );
  CW_TEST_CHECK( upl.get_num_sent() == 0 );

  // resume before anything was created
  upload u3;
  u3.set_payload( pay );
  u3.set_target( env.target_ );
  key_pair ckey;
  ckey.gen();
  u3.set_chunk_key_pair( ckey );
  CW_TEST_CHECK( upl.status( u3 ) );
  CW_TEST_CHECK( u3.get_state() == e_upload_uninitialized );
  CW_TEST_CHECK( upl.resume( u3 ) );
  CW_TEST_CHECK( upl.get_num_sent() == 1 + num_chunks );
  CW_TEST_CHECK( read_back( env, u3, res ) && res == pay );
}

void test_lost_confirm()
{
  upload_env env;
  uploader upl;
  env.init_uploader( upl );
  std::vector<uint8_t> pay = make_payload( 1019 * 3 );

  // create and second write land but are reported as failed
  env.sim_.lose_at( 0 );
  env.sim_.lose_at( 2 );
  upload u;
  u.set_payload( pay );
  u.set_target( env.target_ );
  CW_TEST_CHECK( upl.begin_upload( u ) );
  CW_TEST_CHECK( env.sim_.get_num_submitted() == 4 );
  CW_TEST_CHECK( env.sim_.get_num_writes() == 3 );
  std::vector<uint8_t> res;
  CW_TEST_CHECK( read_back( env, u, res ) && res == pay );
}

void test_dropped()
{
  upload_env env;
  uploader upl;
  env.init_uploader( upl );
  std::vector<uint8_t> pay = make_payload( 1019 * 3 );

  // dropped write followed by two failed account reads
  env.sim_.drop_at( 1 );
  env.sim_.fail_reads( 2 );
  upload u;
  u.set_payload( pay );
  u.set_target( env.target_ );
  CW_TEST_CHECK( upl.begin_upload( u ) );
  CW_TEST_CHECK( env.sim_.get_num_submitted() == 5 );
  CW_TEST_CHECK( env.sim_.get_num_writes() == 3 );
  std::vector<uint8_t> res;
  CW_TEST_CHECK( read_back( env, u, res ) && res == pay );

  // no progress at all
  upload u2;
  u2.set_payload( pay );
  u2.set_target( env.target_ );
  upl.set_max_retries( 2 );
  uint64_t num_sub = env.sim_.get_num_submitted();
  env.sim_.set_fail_from( num_sub + 1 );
  CW_TEST_CHECK( !upl.begin_upload( u2 ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_transient );
  CW_TEST_CHECK( env.sim_.get_num_submitted() == num_sub + 4 );
  CW_TEST_CHECK( u2.get_written() == 0 );
}

void test_rejected()
{
  upload_env env;
  uploader upl;
  env.init_uploader( upl );
  std::vector<uint8_t> pay = make_payload( 100 );
  upload u;
  u.set_payload( pay );
  u.set_target( env.target_ );
  CW_TEST_CHECK( upl.begin_upload( u ) );

  // writes that break the protocol are rejected by the program
  key_pair other;
  other.gen();
  env.sim_.fund( pub_key( other ), init_balance );
  char buf[CW_TX_MAX_SIZE];
  hash bhash;
  CW_TEST_CHECK( env.sim_.get_block_hash( bhash ) );
  {
    bincode tx( buf );
    CW_TEST_CHECK( tx::write( tx, bhash, other, u.get_chunk_account(),
                              env.gpub_, 100, pay.data(), 1 ) );
    CW_TEST_CHECK( !env.sim_.send_transaction( tx.get_buf(), tx.size() ) );
    CW_TEST_CHECK( env.sim_.get_err_kind() == e_err_protocol );
    CW_TEST_CHECK( env.sim_.get_err_code() == CW_ERR_UNAUTHORIZED );
  }
  {
    bincode tx( buf );
    CW_TEST_CHECK( tx::write( tx, bhash, env.wkey_, u.get_chunk_account(),
                              env.gpub_, 50, pay.data(), 1 ) );
    CW_TEST_CHECK( !env.sim_.send_transaction( tx.get_buf(), tx.size() ) );
    CW_TEST_CHECK( env.sim_.get_err_code() == CW_ERR_OUT_OF_ORDER_WRITE );
  }
  {
    bincode tx( buf );
    CW_TEST_CHECK( tx::write( tx, bhash, env.wkey_, u.get_chunk_account(),
                              env.gpub_, 100, pay.data(), 1 ) );
    CW_TEST_CHECK( !env.sim_.send_transaction( tx.get_buf(), tx.size() ) );
    CW_TEST_CHECK( env.sim_.get_err_code() == CW_ERR_OVERFLOW );
  }
  {
    bincode tx( buf );
    CW_TEST_CHECK( tx::close( tx, bhash, other, u.get_chunk_account(),
                              env.gpub_ ) );
    CW_TEST_CHECK( !env.sim_.send_transaction( tx.get_buf(), tx.size() ) );
    CW_TEST_CHECK( env.sim_.get_err_code() == CW_ERR_UNAUTHORIZED );
  }
  std::vector<uint8_t> res;
  CW_TEST_CHECK( read_back( env, u, res ) && res == pay );

  // an account written by someone else is not resumed
  uploader upl2;
  env.init_uploader( upl2 );
  upl2.set_writer( &other );
  CW_TEST_CHECK( !upl2.resume( u ) );
  CW_TEST_CHECK( upl2.get_err_kind() == e_err_invalid );
  CW_TEST_CHECK( upl2.get_err_code() == CW_ERR_WRITER_MISMATCH );
  CW_TEST_CHECK( upl2.get_num_sent() == 0 );

  // nor one staged for a different payload
  upload u2;
  u2.set_payload( make_payload( 99 ) );
  u2.set_target( env.target_ );
  u2.set_chunk_key_pair( u.get_chunk_key_pair() );
  CW_TEST_CHECK( !upl.resume( u2 ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_invalid );

  // more than fits in one account
  upload u3;
  u3.set_payload( std::vector<uint8_t>( CW_MAX_PAYLOAD + 1, 0 ) );
  u3.set_target( env.target_ );
  uint64_t num_sub = env.sim_.get_num_submitted();
  CW_TEST_CHECK( !upl.begin_upload( u3 ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_invalid );
  CW_TEST_CHECK( env.sim_.get_num_submitted() == num_sub );

  // unconfigured uploader
  uploader upl3;
  CW_TEST_CHECK( !upl3.begin_upload( u ) );
  CW_TEST_CHECK( upl3.get_err_kind() == e_err_invalid );
}

void test_cancel()
{
  upload_env env;
  uploader upl;
  env.init_uploader( upl );
  upload u;
  u.set_payload( make_payload( 5000 ) );
  u.set_target( env.target_ );

  cancel_token ctok;
  upl.set_cancel_token( &ctok );
  ctok.cancel();
  CW_TEST_CHECK( !upl.begin_upload( u ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_cancelled );
  CW_TEST_CHECK( env.sim_.get_num_submitted() == 0 );

  cancel_token ctok2;
  ctok2.set_deadline( get_now() - 1 );
  upl.set_cancel_token( &ctok2 );
  CW_TEST_CHECK( !upl.begin_upload( u ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_cancelled );

  // cancelled while waiting to retry
  cancel_token ctok3;
  upl.set_cancel_token( &ctok3 );
  upl.set_retry_delay( 60L * CW_NSECS_IN_SEC );
  env.sim_.set_fail_from( 0 );
  std::thread thrd( [&ctok3]() {
    sleep_nsecs( 50L * CW_NSECS_IN_MSEC );
    ctok3.cancel();
  } );
  int64_t ts = get_now();
  CW_TEST_CHECK( !upl.begin_upload( u ) );
  thrd.join();
  CW_TEST_CHECK( upl.get_err_kind() == e_err_cancelled );
  CW_TEST_CHECK( get_now() - ts < 30L * CW_NSECS_IN_SEC );
}

void test_empty()
{
  upload_env env;
  uploader upl;
  env.init_uploader( upl );
  upload u;
  u.set_target( env.target_ );
  CW_TEST_CHECK( upl.begin_upload( u ) );
  CW_TEST_CHECK( u.get_state() == e_upload_complete );
  CW_TEST_CHECK( upl.get_num_sent() == 1 );
  CW_TEST_CHECK( upl.get_num_writes() == 0 );
  std::vector<uint8_t> res( 1 );
  CW_TEST_CHECK( read_back( env, u, res ) && res.empty() );
}

void test_concurrent()
{
  upload_env env;
  const unsigned num_thrd = 4;
  std::vector<upload> uv( num_thrd );
  std::vector<int> ok( num_thrd, 0 );
  std::vector<std::thread> thrds;
  for( unsigned i = 0; i != num_thrd; ++i ) {
    std::vector<uint8_t> pay = make_payload( 3000 + 500 * i );
    pay[0] = (uint8_t)i;
    uv[i].set_payload( pay );
    uv[i].set_target( env.target_ );
    thrds.emplace_back( [&env, &uv, &ok, i]() {
      uploader upl;
      env.init_uploader( upl );
      ok[i] = upl.begin_upload( uv[i] );
    } );
  }
  for( std::thread& thrd : thrds ) {
    thrd.join();
  }
  for( unsigned i = 0; i != num_thrd; ++i ) {
    CW_TEST_CHECK( ok[i] );
    std::vector<uint8_t> res;
    CW_TEST_CHECK( read_back( env, uv[i], res ) );
    CW_TEST_CHECK( res == uv[i].get_payload() );
  }
}

void test_closed()
{
  upload_env env;
  uploader upl;
  env.init_uploader( upl );
  std::vector<uint8_t> pay = make_payload( 3000 );
  upload u;
  u.set_payload( pay );
  u.set_target( env.target_ );
  CW_TEST_CHECK( upl.begin_upload( u ) );
  CW_TEST_CHECK( upl.close( u ) );
  CW_TEST_CHECK( u.get_state() == e_upload_closed );
  CW_TEST_CHECK( env.sim_.find_account( u.get_chunk_account() ) == nullptr );

  // the same handle is not started again
  uint64_t num_sub = env.sim_.get_num_submitted();
  CW_TEST_CHECK( !upl.begin_upload( u ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_invalid );

  // later process holding the key of the closed account
  upload u2;
  u2.set_payload( pay );
  u2.set_target( env.target_ );
  u2.set_chunk_key_pair( u.get_chunk_key_pair() );
  u2.set_is_created( true );
  CW_TEST_CHECK( upl.status( u2 ) );
  CW_TEST_CHECK( u2.get_state() == e_upload_closed );
  CW_TEST_CHECK( !upl.resume( u2 ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_invalid );
  CW_TEST_CHECK( upl.close( u2 ) );
  CW_TEST_CHECK( env.sim_.get_num_submitted() == num_sub );
  CW_TEST_CHECK( env.sim_.find_account( u.get_chunk_account() ) == nullptr );
}

void test_changed_payload()
{
  upload_env env;
  std::vector<uint8_t> pay = make_payload( 1019 * 4 );
  upload u;
  u.set_payload( pay );
  u.set_target( env.target_ );
  {
    uploader upl;
    env.init_uploader( upl );
    upl.set_max_retries( 0 );
    env.sim_.set_fail_from( 3 );
    CW_TEST_CHECK( !upl.begin_upload( u ) );
    CW_TEST_CHECK( u.get_written() == 1019 * 2 );
  }
  env.sim_.clear_faults();

  // same length but different bytes below the high-water mark
  upload u2;
  u2.set_payload( std::vector<uint8_t>( pay.size(), 'Z' ) );
  u2.set_target( env.target_ );
  u2.set_chunk_key_pair( u.get_chunk_key_pair() );
  uploader upl;
  env.init_uploader( upl );
  CW_TEST_CHECK( !upl.resume( u2 ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_invalid );
  CW_TEST_CHECK( upl.get_num_sent() == 0 );
  CW_TEST_CHECK( env.sim_.get_num_writes() == 2 );

  // differences past the high-water mark go unnoticed until written
  std::vector<uint8_t> pay3 = pay;
  pay3[1019 * 2] = 'Z';
  upload u3;
  u3.set_payload( pay3 );
  u3.set_target( env.target_ );
  u3.set_chunk_key_pair( u.get_chunk_key_pair() );
  CW_TEST_CHECK( upl.resume( u3 ) );
  std::vector<uint8_t> res;
  CW_TEST_CHECK( read_back( env, u3, res ) && res == pay3 );
}

void test_create_rejected()
{
  upload_env env;
  uploader upl;
  env.init_uploader( upl );
  upload u;
  u.set_payload( make_payload( 3000 ) );
  u.set_target( env.target_ );

  // write-account program not deployed under this id
  key_pair gkey;
  gkey.gen();
  upl.set_program_id( pub_key( gkey ) );
  CW_TEST_CHECK( !upl.begin_upload( u ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_protocol );
  CW_TEST_CHECK( upl.get_err_ix() == 1 );
  CW_TEST_CHECK( upl.get_num_sent() == 1 );
  CW_TEST_CHECK( env.sim_.get_num_submitted() == 1 );
  CW_TEST_CHECK( env.sim_.find_account( u.get_chunk_account() ) == nullptr );

  // writer cannot pay for the account. the system program's code 1 is
  // not the write-account program's AlreadyInitialized
  key_pair poor;
  poor.gen();
  upload u2;
  u2.set_payload( make_payload( 3000 ) );
  u2.set_target( env.target_ );
  env.init_uploader( upl );
  upl.set_writer( &poor );
  CW_TEST_CHECK( !upl.begin_upload( u2 ) );
  CW_TEST_CHECK( upl.get_err_kind() == e_err_protocol );
  CW_TEST_CHECK( upl.get_err_ix() == 0 );
  CW_TEST_CHECK( upl.get_err_code() == 1 );
  CW_TEST_CHECK( upl.get_err_msg().find( "AlreadyInitialized" ) ==
                 std::string::npos );
  CW_TEST_CHECK( upl.get_num_sent() == 1 );
  CW_TEST_CHECK( env.sim_.get_num_submitted() == 2 );
}

int main( int, char** )
{
  log::set_level( CW_LOG_ERR_LVL );
  CW_TEST_START
  test_tx();
  test_alphabet();
  test_large();
  test_resume();
  test_lost_confirm();
  test_dropped();
  test_rejected();
  test_cancel();
  test_empty();
  test_concurrent();
  test_closed();
  test_changed_payload();
  test_create_rejected();
  CW_TEST_END
  return 0;
}
