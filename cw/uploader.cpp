#include "uploader.hpp"
#include "log.hpp"
#include <write_account/write_account.h>

using namespace cw;

const char *cw::upload_state_name( upload_state st )
{
  switch( st ) {
    case e_upload_uninitialized: return "uninitialized";
    case e_upload_writing:       return "writing";
    case e_upload_complete:      return "complete";
    case e_upload_closed:        return "closed";
  }
  return "unknown";
}

///////////////////////////////////////////////////////////////////////////
// cancel_token

cancel_token::cancel_token()
: flag_( false ),
  deadline_( 0 )
{
}

void cancel_token::cancel()
{
  flag_ = true;
}

void cancel_token::set_deadline( int64_t ts )
{
  deadline_ = ts;
}

int64_t cancel_token::get_deadline() const
{
  return deadline_;
}

bool cancel_token::get_is_cancelled() const
{
  return flag_ || ( deadline_ && get_now() >= deadline_ );
}

///////////////////////////////////////////////////////////////////////////
// upload

upload::upload()
: has_key_( false ),
  created_( false ),
  st_( e_upload_uninitialized ),
  written_( 0 ),
  total_len_( 0 )
{
}

void upload::set_payload( const uint8_t *buf, size_t len )
{
  buf_.assign( buf, buf + len );
}

void upload::set_payload( const std::vector<uint8_t>& buf )
{
  buf_ = buf;
}

void upload::set_target( const pub_key& target )
{
  target_ = target;
}

void upload::set_chunk_key_pair( const key_pair& kp )
{
  ckey_ = kp;
  ckey_.get_pub_key( cpub_ );
  has_key_ = true;
}

///////////////////////////////////////////////////////////////////////////
// uploader

uploader::uploader()
: lgr_( nullptr ),
  wkey_( nullptr ),
  ctok_( nullptr ),
  limit_( CW_TX_MAX_SIZE ),
  max_chunk_( 0 ),
  max_retries_( 5 ),
  retry_delay_( 500L*CW_NSECS_IN_MSEC ),
  num_sent_( 0 ),
  num_writes_( 0 )
{
}

void uploader::set_ledger( ledger *lgr )
{
  lgr_ = lgr;
}

ledger *uploader::get_ledger() const
{
  return lgr_;
}

void uploader::set_writer( const key_pair *wkey )
{
  wkey_ = wkey;
  if ( wkey_ ) {
    wkey_->get_pub_key( wpub_ );
  }
}

void uploader::set_program_id( const pub_key& gpub )
{
  gpub_ = gpub;
}

const pub_key& uploader::get_program_id() const
{
  return gpub_;
}

bool uploader::set_tx_limit( size_t limit )
{
  chunk_plan plan;
  if ( !plan.set_tx_limit( limit ) ) {
    return set_err( plan );
  }
  limit_ = limit;
  return true;
}

void uploader::set_max_chunk( size_t max_chunk )
{
  max_chunk_ = max_chunk;
}

void uploader::set_max_retries( unsigned max_retries )
{
  max_retries_ = max_retries;
}

unsigned uploader::get_max_retries() const
{
  return max_retries_;
}

void uploader::set_retry_delay( int64_t nsecs )
{
  retry_delay_ = nsecs;
}

void uploader::set_cancel_token( const cancel_token *ctok )
{
  ctok_ = ctok;
}

uint64_t uploader::get_num_sent() const
{
  return num_sent_;
}

uint64_t uploader::get_num_writes() const
{
  return num_writes_;
}

bool uploader::check_config()
{
  reset_err();
  num_sent_ = num_writes_ = 0;
  if ( !lgr_ ) {
    return set_err( e_err_invalid, 0, "no ledger" );
  }
  if ( !wkey_ ) {
    return set_err( e_err_invalid, 0, "no writer key" );
  }
  if ( gpub_.is_zero() ) {
    return set_err( e_err_invalid, 0, "no write-account program id" );
  }
  return true;
}

bool uploader::begin_upload( upload& u )
{
  if ( !check_config() ) {
    return false;
  }
  if ( u.buf_.size() > CW_MAX_PAYLOAD ) {
    return set_err( e_err_invalid, 0,
        "payload exceeds maximum chunk account size" );
  }
  if ( u.created_ ) {
    return set_err( e_err_invalid, 0,
        "chunk account already created, resume instead" );
  }
  if ( !u.has_key_ ) {
    key_pair kp;
    if ( !kp.gen() ) {
      return set_err( e_err_invalid, 0,
          "failed to generate chunk account key" );
    }
    u.set_chunk_key_pair( kp );
  }
  u.st_        = e_upload_uninitialized;
  u.written_   = 0;
  u.total_len_ = u.buf_.size();
  CW_LOG_INF( "begin upload" )
    .add( "account", u.cpub_ )
    .add( "target", u.target_ )
    .add( "len", (uint64_t)u.buf_.size() )
    .end();
  return run( u, false );
}

bool uploader::resume( upload& u )
{
  if ( !check_config() ) {
    return false;
  }
  if ( !u.has_key_ ) {
    return set_err( e_err_invalid, 0, "no chunk account key to resume" );
  }
  u.total_len_ = u.buf_.size();
  CW_LOG_INF( "resume upload" )
    .add( "account", u.cpub_ )
    .add( "target", u.target_ )
    .add( "len", (uint64_t)u.buf_.size() )
    .end();
  return run( u, true );
}

bool uploader::status( upload& u )
{
  if ( !check_config() ) {
    return false;
  }
  bool exists = false;
  return read_account( u, exists, false );
}

bool uploader::close( upload& u )
{
  if ( !check_config() ) {
    return false;
  }
  unsigned nretry = 0;
  for(;;) {
    bool exists = false;
    if ( !read_account( u, exists, false ) ) {
      if ( get_err_kind() != e_err_transient || !on_failure( nretry ) ) {
        return false;
      }
      continue;
    }
    if ( u.st_ == e_upload_closed ) {
      CW_LOG_INF( "chunk account closed" ).add( "account", u.cpub_ ).end();
      reset_err();
      return true;
    }
    if ( !exists ) {
      return set_err( e_err_protocol, CW_ERR_NOT_INITIALIZED,
          "chunk account does not exist" );
    }
    if ( send_close( u ) ) {
      u.st_ = e_upload_closed;
      CW_LOG_INF( "chunk account closed" ).add( "account", u.cpub_ ).end();
      reset_err();
      return true;
    }
    if ( get_err_kind() != e_err_transient || !on_failure( nretry ) ) {
      return false;
    }
  }
}

bool uploader::run( upload& u, bool read_first )
{
  chunk_plan plan;
  plan.set_payload( u.buf_.data(), u.buf_.size() );
  if ( !plan.set_tx_limit( limit_ ) ) {
    return set_err( plan );
  }
  if ( max_chunk_ ) {
    plan.set_max_chunk( max_chunk_ );
  }
  uint64_t total_len = u.buf_.size();
  unsigned nretry = 0;
  bool exists = false;
  bool need_read = read_first;
  for(;;) {
    if ( is_cancelled() ) {
      CW_LOG_WRN( "upload cancelled" )
        .add( "account", u.cpub_ )
        .add( "written", u.written_ )
        .end();
      return set_err( e_err_cancelled, 0, "upload cancelled" );
    }

    // on-chain state is the only source of truth after a failure
    if ( need_read ) {
      bool prev_exists = exists;
      uint64_t prev_written = u.written_;
      if ( !read_account( u, exists, true ) ) {
        if ( get_err_kind() != e_err_transient || !on_failure( nretry ) ) {
          return false;
        }
        continue;
      }
      need_read = false;
      if ( u.st_ == e_upload_closed ) {
        return set_err( e_err_invalid, 0, "chunk account already closed" );
      }
      if ( ( exists && !prev_exists ) || u.written_ > prev_written ) {
        nretry = 0;
      }
      CW_LOG_DBG( "read chunk account" )
        .add( "account", u.cpub_ )
        .add( "state", upload_state_name( u.st_ ) )
        .add( "written", u.written_ )
        .end();
    }

    bool ok;
    bool is_create = !exists;
    if ( is_create ) {
      ok = send_create( u );
      if ( ok ) {
        exists     = true;
        u.created_ = true;
        u.written_ = 0;
        u.st_      = total_len ? e_upload_writing : e_upload_complete;
      }
    } else if ( u.written_ == total_len ) {
      u.st_ = e_upload_complete;
      CW_LOG_INF( "upload complete" )
        .add( "account", u.cpub_ )
        .add( "len", total_len )
        .add( "num_sent", num_sent_ )
        .end();
      reset_err();
      return true;
    } else {
      ok = send_write( u, plan );
    }
    if ( ok ) {
      nretry = 0;
      continue;
    }

    // transient failures and stale offsets are recovered by re-reading
    // the account, everything else is terminal. a create whose system
    // instruction (index 0) fails with custom code 0 "account already in
    // use" means an earlier unconfirmed attempt landed
    bool is_stale = get_err_kind() == e_err_protocol && (
        is_create ? get_err_ix() == 0 && get_err_code() == 0 :
                    get_err_code() == CW_ERR_OUT_OF_ORDER_WRITE );
    if ( get_err_kind() == e_err_transient || is_stale ) {
      if ( !on_failure( nretry ) ) {
        return false;
      }
      need_read = true;
      continue;
    }
    CW_LOG_ERR( "upload failed" )
      .add( "account", u.cpub_ )
      .add( "written", u.written_ )
      .add( "error", *this )
      .end();
    return false;
  }
}

bool uploader::read_account( upload& u, bool& exists, bool is_match )
{
  account_info info;
  if ( !lgr_->get_account( u.cpub_, info ) ) {
    return set_err( *lgr_ );
  }
  exists = info.exists_;
  if ( !exists ) {
    u.st_ = u.created_ ? e_upload_closed : e_upload_uninitialized;
    return true;
  }
  if ( info.owner_ != gpub_ ) {
    return set_err( e_err_integrity, CW_ERR_INCORRECT_OWNER,
        "chunk account not owned by write-account program" );
  }
  const uint8_t *data = info.data_.data();
  uint64_t data_len = info.data_.size();
  uint64_t rc = cw_hdr_check( data, data_len );

  // account and header are created atomically so an all zero header
  // can only be left behind by close
  if ( rc == CW_ERR_NOT_INITIALIZED ) {
    u.created_ = true;
    u.st_ = e_upload_closed;
    return true;
  }
  if ( rc != CW_SUCCESS ) {
    return set_err( e_err_integrity, rc,
        std::string( "chunk account header: " ) + err_code_name( rc ) );
  }
  const cw_acc_hdr_t *hdr = (const cw_acc_hdr_t*)data;
  if ( hdr->written_ > hdr->total_len_ ||
       hdr->total_len_ > data_len - CW_HDR_SIZE ) {
    return set_err( e_err_integrity, CW_ERR_ACCOUNT_SIZE,
        "chunk account header exceeds account data" );
  }
  if ( is_match ) {
    if ( __builtin_memcmp( hdr->writer_.k1_, wpub_.data(), pub_key::len ) ) {
      return set_err( e_err_invalid, CW_ERR_WRITER_MISMATCH,
          "chunk account belongs to a different writer" );
    }
    if ( __builtin_memcmp(
          hdr->target_.k1_, u.target_.data(), pub_key::len ) ) {
      return set_err( e_err_invalid, CW_ERR_WRONG_TARGET_PROGRAM,
          "chunk account has a different target program" );
    }
    if ( hdr->total_len_ != u.buf_.size() ) {
      return set_err( e_err_invalid, CW_ERR_ACCOUNT_SIZE,
          "chunk account declares a different payload length" );
    }
    if ( __builtin_memcmp( &data[CW_HDR_SIZE], u.buf_.data(),
                           hdr->written_ ) ) {
      return set_err( e_err_invalid, 0,
          "chunk account holds different payload bytes" );
    }
  }
  u.created_   = true;
  u.written_   = hdr->written_;
  u.total_len_ = hdr->total_len_;
  u.st_ = u.written_ == u.total_len_ ? e_upload_complete : e_upload_writing;
  return true;
}

bool uploader::send_create( upload& u )
{
  uint64_t len = u.buf_.size();
  uint64_t lamports = 0;
  if ( !lgr_->get_rent_exempt( CW_HDR_SIZE + len, lamports ) ) {
    return set_err( *lgr_ );
  }
  hash bhash;
  if ( !lgr_->get_block_hash( bhash ) ) {
    return set_err( *lgr_ );
  }
  char buf[CW_TX_MAX_SIZE];
  bincode tx( buf );
  if ( !tx::create_and_initialize( tx, bhash, *wkey_, u.ckey_, lamports,
                                   len, len, u.target_, gpub_ ) ) {
    return set_err( e_err_invalid, 0,
        "failed to build create transaction" );
  }
  CW_LOG_DBG( "create chunk account" )
    .add( "account", u.cpub_ )
    .add( "lamports", lamports )
    .add( "capacity", len )
    .end();
  return submit( tx, 1 );
}

bool uploader::send_write( upload& u, const chunk_plan& plan )
{
  chunk c;
  if ( !plan.first( c, u.written_ ) ) {
    return set_err( e_err_invalid, 0, "no chunk at offset" );
  }
  hash bhash;
  if ( !lgr_->get_block_hash( bhash ) ) {
    return set_err( *lgr_ );
  }
  char buf[CW_TX_MAX_SIZE];
  bincode tx( buf );
  if ( !tx::write( tx, bhash, *wkey_, u.cpub_, gpub_,
                   c.off_, c.buf_, c.len_ ) ) {
    return set_err( e_err_invalid, 0,
        "write transaction exceeds size limit" );
  }
  CW_LOG_DBG( "write chunk" )
    .add( "account", u.cpub_ )
    .add( "offset", c.off_ )
    .add( "len", (uint64_t)c.len_ )
    .end();
  ++num_writes_;
  if ( !submit( tx, 0 ) ) {
    return false;
  }
  u.written_ += c.len_;
  u.st_ = u.written_ == u.buf_.size() ? e_upload_complete : e_upload_writing;
  return true;
}

bool uploader::send_close( upload& u )
{
  hash bhash;
  if ( !lgr_->get_block_hash( bhash ) ) {
    return set_err( *lgr_ );
  }
  char buf[CW_TX_MAX_SIZE];
  bincode tx( buf );
  if ( !tx::close( tx, bhash, *wkey_, u.cpub_, gpub_ ) ) {
    return set_err( e_err_invalid, 0, "failed to build close transaction" );
  }
  return submit( tx, 0 );
}

bool uploader::submit( bincode& tx, int prog_ix )
{
  ++num_sent_;
  if ( lgr_->send_transaction( tx.get_buf(), tx.size() ) ) {
    return true;
  }
  set_err( *lgr_ );

  // custom codes are only write-account errors when the write-account
  // instruction is the one that failed
  int ix = get_err_ix();
  if ( get_err_kind() == e_err_protocol && ix == prog_ix &&
       get_err_code() != CW_BUILTIN_ERR_CODE ) {
    uint64_t code = get_err_code();
    set_err( e_err_protocol, code, "instruction " + std::to_string( ix ) +
        " failed: " + err_code_name( code ) );
    set_err_ix( ix );
  }
  return false;
}

bool uploader::on_failure( unsigned& nretry )
{
  if ( ++nretry > max_retries_ ) {
    CW_LOG_ERR( "giving up after retries" )
      .add( "retries", max_retries_ )
      .add( "error", *this )
      .end();
    return false;
  }
  CW_LOG_WRN( "retrying after failure" )
    .add( "attempt", nretry )
    .add( "error", *this )
    .end();

  // sleep in short slices so cancellation is noticed promptly
  int64_t end_ts = get_now() + retry_delay_;
  for(;;) {
    if ( is_cancelled() ) {
      return set_err( e_err_cancelled, 0, "upload cancelled" );
    }
    int64_t now = get_now();
    if ( now >= end_ts ) {
      return true;
    }
    int64_t slice = 10L*CW_NSECS_IN_MSEC;
    sleep_nsecs( end_ts - now < slice ? end_ts - now : slice );
  }
}

bool uploader::is_cancelled()
{
  return ctok_ && ctok_->get_is_cancelled();
}
