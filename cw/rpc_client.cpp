#include "rpc_client.hpp"
#include "log.hpp"
#include <write_account/write_account.h>
#include <zstd.h>

using namespace cw;

// block(slot) commitment
static const char *commitment_str[] = {
  "unknown",
  "processed",
  "confirmed",
  "finalized"
};

namespace cw
{

  str commitment_to_str( commitment val )
  {
    unsigned iv = (unsigned)val;
    if ( iv >= (unsigned)commitment::e_last_commitment ) {
      iv = 0;
    }
    return commitment_str[iv];
  }

  commitment str_to_commitment( str s )
  {
    for( unsigned i=0;
         i != (unsigned)commitment::e_last_commitment; ++i ) {
      if ( s == commitment_str[i] ) {
        return (commitment)i;
      }
    }
    return commitment::e_unknown;
  }

  void decode_tx_err( const jtree& jt, uint32_t etok, error& err )
  {
    // unit variants arrive as plain strings
    if ( jt.get_type( etok ) == jtree::e_val ) {
      str txt = jt.get_str( etok );
      bool retry = txt == str( "BlockhashNotFound" ) ||
                   txt == str( "AlreadyProcessed" );
      err.set_err( retry ? e_err_transient : e_err_protocol, 0,
                   "transaction failed: " + txt.as_string() );
      return;
    }
    uint32_t itok = jt.find_val( etok, "InstructionError" );
    if ( itok && jt.get_type( itok ) == jtree::e_arr ) {
      uint32_t xtok = jt.get_first( itok );
      uint32_t dtok = xtok ? jt.get_next( xtok ) : 0;
      uint64_t ix = jt.get_uint( xtok );
      std::string emsg = "instruction " + std::to_string( ix ) + " failed: ";

      // custom codes belong to whichever program the instruction invoked
      // so only the caller that built the transaction can name them
      uint32_t ctok = jt.find_val( dtok, "Custom" );
      if ( ctok ) {
        uint64_t code = jt.get_uint( ctok );
        err.set_err( e_err_protocol, code,
            emsg + "custom program error " + std::to_string( code ) );
      } else {
        err.set_err( e_err_protocol, CW_BUILTIN_ERR_CODE,
            emsg + jt.get_str( dtok ).as_string() );
      }
      err.set_err_ix( (int)ix );
      return;
    }
    // other struct variants keyed by name
    uint32_t ktok = jt.get_type( etok ) == jtree::e_obj ?
      jt.get_first( etok ) : 0;
    std::string name = ktok ?
      jt.get_str( jt.get_key( ktok ) ).as_string() : "unknown";
    err.set_err( e_err_protocol, 0, "transaction failed: " + name );
  }

}

///////////////////////////////////////////////////////////////////////////
// rpc_client

rpc_client::rpc_client()
: hptr_( nullptr ),
  id_( 0UL ),
  cxt_( nullptr )
{
  hp_.cp_ = this;
  cxt_ = ZSTD_createDCtx();
}

rpc_client::~rpc_client()
{
  if ( cxt_ ) {
    ZSTD_freeDCtx( (ZSTD_DCtx*)cxt_ );
    cxt_ = nullptr;
  }
}

void rpc_client::set_http_conn( tcp_connect *hptr )
{
  hptr_ = hptr;
  hptr_->set_net_parser( &hp_ );
}

tcp_connect *rpc_client::get_http_conn() const
{
  return hptr_;
}

void rpc_client::reset()
{
  rv_.clear();
}

void rpc_client::send( rpc_request *rptr )
{
  uint64_t id = ++id_;
  rptr->reset_err();
  rptr->set_id( id );
  rptr->set_rpc_client( this );
  rptr->set_sent_time( get_now() );
  rptr->set_recv_time( 0 );
  rv_[id] = rptr;

  // construct json message
  json_wtr jw;
  jw.add_val( json_wtr::e_obj );
  jw.add_key( "jsonrpc", "2.0" );
  jw.add_key( "id", id );
  rptr->request( jw );
  jw.pop();

  // submit http POST request
  http_request msg;
  msg.init( "POST", "/" );
  msg.add_hdr( "Host", hptr_->get_host() );
  msg.add_hdr( "Content-Type", "application/json" );
  msg.commit( jw );
  hptr_->add_send( msg );
}

void rpc_client::rpc_http::parse_content( const char *txt, size_t len )
{
  cp_->parse_response( txt, len );
}

void rpc_client::parse_response( const char *txt, size_t len )
{
  // parse and redirect response to corresponding request
  jp_.parse( txt, len );
  uint32_t idtok = jp_.find_val( 1, "id" );
  if ( !jp_.is_valid() || !idtok ) {
    CW_LOG_WRN( "unexpected rpc response" )
      .add( "len", (uint64_t)len )
      .end();
    return;
  }
  const uint64_t id = jp_.get_uint( idtok );
  request_t::iterator it = rv_.find( id );
  if ( it == rv_.end() ) {
    CW_LOG_DBG( "stale rpc response" ).add( "id", id ).end();
    return;
  }
  rpc_request *rptr = it->second;
  rv_.erase( it );
  rptr->response( jp_ );
}

bool rpc_client::decode_data( str data, std::vector<uint8_t>& res )
{
  res.clear();
  abuf_.resize( data.len_ );
  int dlen = dec_base64(
      (const uint8_t*)data.str_, data.len_, (uint8_t*)abuf_.data() );
  if ( dlen < 0 ) {
    return set_err_msg( "invalid base64 account data" );
  }
  if ( dlen == 0 ) {
    return true;
  }

  // frame content size is not always recorded so stream the output
  ZSTD_DCtx *cxt = (ZSTD_DCtx*)cxt_;
  ZSTD_DCtx_reset( cxt, ZSTD_reset_session_only );
  ZSTD_inBuffer in = { abuf_.data(), (size_t)dlen, 0 };
  std::vector<uint8_t> out( ZSTD_DStreamOutSize() );
  for(;;) {
    ZSTD_outBuffer ob = { out.data(), out.size(), 0 };
    size_t rc = ZSTD_decompressStream( cxt, &ob, &in );
    if ( ZSTD_isError( rc ) ) {
      return set_err_msg( std::string( "failed to decompress account data: " )
          + ZSTD_getErrorName( rc ) );
    }
    res.insert( res.end(), out.data(), out.data() + ob.pos );
    if ( rc == 0 ) {
      break;
    }
    if ( in.pos == in.size && ob.pos < ob.size ) {
      return set_err_msg( "truncated account data" );
    }
  }
  return true;
}

///////////////////////////////////////////////////////////////////////////
// rpc_request

rpc_request::rpc_request()
: cp_( nullptr ),
  id_( 0UL ),
  ec_( 0 ),
  sent_ts_( 0L ),
  recv_ts_( 0L )
{
}

rpc_request::~rpc_request()
{
}

void rpc_request::set_rpc_client( rpc_client *cptr )
{
  cp_ = cptr;
}

rpc_client *rpc_request::get_rpc_client() const
{
  return cp_;
}

void rpc_request::set_id( uint64_t id )
{
  id_ = id;
}

uint64_t rpc_request::get_id() const
{
  return id_;
}

void rpc_request::set_rpc_code( int ecode )
{
  ec_ = ecode;
}

int rpc_request::get_rpc_code() const
{
  return ec_;
}

void rpc_request::set_sent_time( int64_t sent_ts )
{
  sent_ts_ = sent_ts;
}

int64_t rpc_request::get_sent_time() const
{
  return sent_ts_;
}

void rpc_request::set_recv_time( int64_t recv_ts )
{
  recv_ts_ = recv_ts;
}

int64_t rpc_request::get_recv_time() const
{
  return recv_ts_;
}

bool rpc_request::get_is_recv() const
{
  return recv_ts_ != 0 && recv_ts_ >= sent_ts_;
}

void rpc_request::on_response()
{
  set_recv_time( get_now() );
}

// node errors are transient unless preflight simulation reports the
// transaction error itself
bool rpc_request::on_error( const jtree& jt )
{
  uint32_t etok = jt.find_val( 1, "error" );
  if ( etok == 0 ) {
    if ( jt.find_val( 1, "result" ) == 0 ) {
      set_err( e_err_transient, 0, "rpc response missing result" );
      on_response();
      return true;
    }
    return false;
  }
  std::string emsg = jt.get_str( jt.find_val( etok, "message" ) ).as_string();
  set_rpc_code( (int)jt.get_int( jt.find_val( etok, "code" ) ) );
  uint32_t dtok = jt.find_val( etok, "data" );
  uint32_t xtok = jt.find_val( dtok, "err" );
  if ( xtok && !jt.is_null( xtok ) ) {
    decode_tx_err( jt, xtok, *this );
  } else {
    set_err( e_err_transient, 0, emsg );
  }
  on_response();
  return true;
}

///////////////////////////////////////////////////////////////////////////
// get_latest_block_hash

rpc::get_latest_block_hash::get_latest_block_hash()
: cmt_( e_confirmed ),
  slot_( 0 ),
  height_( 0 )
{
}

void rpc::get_latest_block_hash::set_commitment( commitment cmt )
{
  cmt_ = cmt;
}

uint64_t rpc::get_latest_block_hash::get_slot() const
{
  return slot_;
}

const hash& rpc::get_latest_block_hash::get_block_hash() const
{
  return bhash_;
}

uint64_t rpc::get_latest_block_hash::get_last_valid_height() const
{
  return height_;
}

void rpc::get_latest_block_hash::request( json_wtr& msg )
{
  msg.add_key( "method", "getLatestBlockhash" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val( json_wtr::e_obj );
  msg.add_key( "commitment", commitment_to_str( cmt_ ) );
  msg.pop();
  msg.pop();
}

void rpc::get_latest_block_hash::response( const jtree& jt )
{
  if ( on_error( jt ) ) return;
  uint32_t rtok = jt.find_val( 1, "result" );
  uint32_t ctok = jt.find_val( rtok, "context" );
  slot_ = jt.get_uint( jt.find_val( ctok, "slot" ) );
  uint32_t vtok = jt.find_val( rtok, "value" );
  if ( !bhash_.init_from_text( jt.get_str(
          jt.find_val( vtok, "blockhash" ) ) ) ) {
    set_err( e_err_transient, 0, "invalid block hash in response" );
  }
  height_ = jt.get_uint( jt.find_val( vtok, "lastValidBlockHeight" ) );
  on_response();
}

///////////////////////////////////////////////////////////////////////////
// get_minimum_balance_rent_exemption

rpc::get_minimum_balance_rent_exemption::get_minimum_balance_rent_exemption()
: sz_( 0 ),
  lamports_( 0 )
{
}

void rpc::get_minimum_balance_rent_exemption::set_size( size_t sz )
{
  sz_ = sz;
}

uint64_t rpc::get_minimum_balance_rent_exemption::get_lamports() const
{
  return lamports_;
}

void rpc::get_minimum_balance_rent_exemption::request( json_wtr& msg )
{
  msg.add_key( "method", "getMinimumBalanceForRentExemption" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val( (uint64_t)sz_ );
  msg.pop();
}

void rpc::get_minimum_balance_rent_exemption::response( const jtree& jt )
{
  if ( on_error( jt ) ) return;
  lamports_ = jt.get_uint( jt.find_val( 1, "result" ) );
  on_response();
}

///////////////////////////////////////////////////////////////////////////
// get_account_info

rpc::get_account_info::get_account_info()
: cmt_( e_confirmed ),
  exists_( false ),
  slot_( 0 ),
  lamports_( 0 )
{
}

void rpc::get_account_info::set_account( const pub_key& acc )
{
  acc_ = acc;
}

void rpc::get_account_info::set_commitment( commitment cmt )
{
  cmt_ = cmt;
}

bool rpc::get_account_info::get_is_exists() const
{
  return exists_;
}

uint64_t rpc::get_account_info::get_slot() const
{
  return slot_;
}

uint64_t rpc::get_account_info::get_lamports() const
{
  return lamports_;
}

const pub_key& rpc::get_account_info::get_owner() const
{
  return owner_;
}

const std::vector<uint8_t>& rpc::get_account_info::get_data() const
{
  return data_;
}

void rpc::get_account_info::request( json_wtr& msg )
{
  msg.add_key( "method", "getAccountInfo" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val( acc_ );
  msg.add_val( json_wtr::e_obj );
  msg.add_key( "encoding", "base64+zstd" );
  msg.add_key( "commitment", commitment_to_str( cmt_ ) );
  msg.pop();
  msg.pop();
}

void rpc::get_account_info::response( const jtree& jt )
{
  if ( on_error( jt ) ) return;
  uint32_t rtok = jt.find_val( 1, "result" );
  uint32_t ctok = jt.find_val( rtok, "context" );
  slot_ = jt.get_uint( jt.find_val( ctok, "slot" ) );
  uint32_t vtok = jt.find_val( rtok, "value" );
  exists_ = !jt.is_null( vtok );
  data_.clear();
  lamports_ = 0;
  owner_.zero();
  if ( exists_ ) {
    lamports_ = jt.get_uint( jt.find_val( vtok, "lamports" ) );
    owner_.init_from_text( jt.get_str( jt.find_val( vtok, "owner" ) ) );
    uint32_t dtok = jt.find_val( vtok, "data" );
    uint32_t btok = jt.get_first( dtok );
    uint32_t etok = btok ? jt.get_next( btok ) : 0;
    str b64 = jt.get_str( btok );
    if ( etok && jt.get_str( etok ) == str( "base64" ) ) {
      data_.resize( b64.len_ );
      int dlen = dec_base64( (const uint8_t*)b64.str_, b64.len_, data_.data() );
      if ( dlen < 0 ) {
        set_err_msg( "invalid base64 account data" );
        dlen = 0;
      }
      data_.resize( dlen );
    } else if ( !get_rpc_client()->decode_data( b64, data_ ) ) {
      set_err( *get_rpc_client() );
      get_rpc_client()->reset_err();
    }
  }
  on_response();
}

///////////////////////////////////////////////////////////////////////////
// send_transaction

rpc::send_transaction::send_transaction()
: cmt_( e_confirmed )
{
}

void rpc::send_transaction::set_transaction( const char *buf, size_t len )
{
  tx_.assign( buf, len );
}

void rpc::send_transaction::set_commitment( commitment cmt )
{
  cmt_ = cmt;
}

const signature& rpc::send_transaction::get_signature() const
{
  return sig_;
}

void rpc::send_transaction::request( json_wtr& msg )
{
  msg.add_key( "method", "sendTransaction" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val_enc_base64( str( tx_ ) );
  msg.add_val( json_wtr::e_obj );
  msg.add_key( "encoding", "base64" );
  msg.add_key( "preflightCommitment", commitment_to_str( cmt_ ) );
  msg.pop();
  msg.pop();
}

void rpc::send_transaction::response( const jtree& jt )
{
  if ( on_error( jt ) ) return;
  if ( !sig_.init_from_text(
        jt.get_str( jt.find_val( 1, "result" ) ).as_string() ) ) {
    set_err( e_err_transient, 0, "invalid signature in response" );
  }
  on_response();
}

///////////////////////////////////////////////////////////////////////////
// get_signature_statuses

rpc::get_signature_statuses::get_signature_statuses()
: found_( false ),
  st_( e_unknown )
{
}

void rpc::get_signature_statuses::set_signature( const signature& sig )
{
  sig_ = sig;
}

bool rpc::get_signature_statuses::get_is_found() const
{
  return found_;
}

commitment rpc::get_signature_statuses::get_status() const
{
  return st_;
}

bool rpc::get_signature_statuses::get_is_tx_err() const
{
  return txerr_.get_is_err();
}

const error& rpc::get_signature_statuses::get_tx_err() const
{
  return txerr_;
}

void rpc::get_signature_statuses::request( json_wtr& msg )
{
  msg.add_key( "method", "getSignatureStatuses" );
  msg.add_key( "params", json_wtr::e_arr );
  msg.add_val( json_wtr::e_arr );
  msg.add_val( sig_ );
  msg.pop();
  msg.pop();
}

void rpc::get_signature_statuses::response( const jtree& jt )
{
  found_ = false;
  st_ = e_unknown;
  txerr_.reset_err();
  if ( on_error( jt ) ) return;
  uint32_t rtok = jt.find_val( 1, "result" );
  uint32_t vtok = jt.find_val( rtok, "value" );
  uint32_t stok = vtok ? jt.get_first( vtok ) : 0;
  if ( stok && !jt.is_null( stok ) ) {
    found_ = true;
    st_ = str_to_commitment(
        jt.get_str( jt.find_val( stok, "confirmationStatus" ) ) );
    uint32_t etok = jt.find_val( stok, "err" );
    if ( etok && !jt.is_null( etok ) ) {
      decode_tx_err( jt, etok, txerr_ );
    }
  }
  on_response();
}
