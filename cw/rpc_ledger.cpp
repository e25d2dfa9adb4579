#include "rpc_ledger.hpp"
#include "log.hpp"
#include <algorithm>

using namespace cw;

rpc_ledger::rpc_ledger()
: rhost_( "localhost:8899" ),
  cmt_( e_confirmed ),
  rpc_timeout_( 30L*CW_NSECS_IN_SEC ),
  cnf_timeout_( 60L*CW_NSECS_IN_SEC ),
  poll_intv_( 400L*CW_NSECS_IN_MSEC )
{
}

void rpc_ledger::set_rpc_host( const std::string& rhost )
{
  rhost_ = rhost;
}

std::string rpc_ledger::get_rpc_host() const
{
  return rhost_;
}

void rpc_ledger::set_commitment( commitment cmt )
{
  cmt_ = cmt;
}

commitment rpc_ledger::get_commitment() const
{
  return cmt_;
}

void rpc_ledger::set_rpc_timeout( int64_t nsecs )
{
  rpc_timeout_ = nsecs;
}

int64_t rpc_ledger::get_rpc_timeout() const
{
  return rpc_timeout_;
}

void rpc_ledger::set_confirm_timeout( int64_t nsecs )
{
  cnf_timeout_ = nsecs;
}

int64_t rpc_ledger::get_confirm_timeout() const
{
  return cnf_timeout_;
}

void rpc_ledger::set_poll_interval( int64_t nsecs )
{
  poll_intv_ = nsecs;
}

bool rpc_ledger::init()
{
  if ( !nl_.init() ) {
    return set_err( nl_ );
  }
  int port = 8899;
  std::string host = get_host_port( rhost_, port );
  hconn_.set_host( host );
  hconn_.set_port( port );
  hconn_.set_net_loop( &nl_ );
  hconn_.set_connect_timeout( std::min( rpc_timeout_, 10L*CW_NSECS_IN_SEC ) );
  clnt_.set_http_conn( &hconn_ );
  return reconnect();
}

bool rpc_ledger::reconnect()
{
  clnt_.reset();
  if ( !hconn_.init() ) {
    CW_LOG_WRN( "failed to connect to rpc node" )
      .add( "host", rhost_ )
      .add( "error", hconn_ )
      .end();
    return set_err( hconn_ );
  }
  CW_LOG_DBG( "connected to rpc node" ).add( "host", rhost_ ).end();
  return true;
}

bool rpc_ledger::call( rpc_request *req )
{
  reset_err();
  if ( hconn_.get_fd() < 0 || hconn_.get_is_err() ) {
    if ( !reconnect() ) {
      return false;
    }
  }
  clnt_.send( req );
  hconn_.poll_send();
  int64_t end_ts = get_now() + rpc_timeout_;
  while( !req->get_is_recv() ) {
    if ( hconn_.get_is_err() || hconn_.get_fd() < 0 ) {
      std::string emsg = "rpc connection lost";
      if ( hconn_.get_is_err() ) {
        emsg += ": " + hconn_.get_err_msg();
      }
      hconn_.teardown();
      clnt_.reset();
      return set_err( e_err_transient, 0, emsg );
    }
    int64_t now = get_now();
    if ( now >= end_ts ) {
      // a late reply must not be matched against a later request
      hconn_.teardown();
      clnt_.reset();
      return set_err( e_err_transient, 0, "rpc request timed out" );
    }
    int64_t wait_ms = ( end_ts - now ) / CW_NSECS_IN_MSEC + 1;
    nl_.poll( (int)std::min( wait_ms, (int64_t)100 ) );
  }
  if ( req->get_is_err() ) {
    return set_err( *req );
  }
  return true;
}

bool rpc_ledger::get_block_hash( hash& bhash )
{
  rpc::get_latest_block_hash req;
  req.set_commitment( cmt_ );
  if ( !call( &req ) ) {
    return false;
  }
  bhash = req.get_block_hash();
  return true;
}

bool rpc_ledger::get_rent_exempt( uint64_t data_len, uint64_t& lamports )
{
  rpc::get_minimum_balance_rent_exemption req;
  req.set_size( data_len );
  if ( !call( &req ) ) {
    return false;
  }
  lamports = req.get_lamports();
  return true;
}

bool rpc_ledger::get_account( const pub_key& acc, account_info& info )
{
  rpc::get_account_info req;
  req.set_account( acc );
  req.set_commitment( cmt_ );
  if ( !call( &req ) ) {
    return false;
  }
  info.exists_   = req.get_is_exists();
  info.lamports_ = req.get_lamports();
  info.owner_    = req.get_owner();
  info.data_     = req.get_data();
  return true;
}

bool rpc_ledger::send_transaction( const char *buf, size_t len )
{
  rpc::send_transaction req;
  req.set_transaction( buf, len );
  req.set_commitment( cmt_ );
  if ( !call( &req ) ) {
    return false;
  }
  signature sig = req.get_signature();
  CW_LOG_DBG( "sent transaction" )
    .add( "sig", sig )
    .add( "len", (uint64_t)len )
    .end();

  // poll status until the transaction reaches our commitment level
  rpc::get_signature_statuses sreq;
  sreq.set_signature( sig );
  int64_t end_ts = get_now() + cnf_timeout_;
  for(;;) {
    if ( call( &sreq ) ) {
      if ( sreq.get_is_found() ) {
        if ( sreq.get_is_tx_err() ) {
          return set_err( sreq.get_tx_err() );
        }
        if ( sreq.get_status() >= cmt_ ) {
          return true;
        }
      }
    } else {
      CW_LOG_DBG( "signature status poll failed" )
        .add( "sig", sig )
        .add( "error", *this )
        .end();
    }
    if ( get_now() >= end_ts ) {
      std::string sstr;
      sig.enc_base58( sstr );
      return set_err( e_err_transient, 0,
          "transaction not confirmed before timeout sig=" + sstr );
    }
    sleep_nsecs( poll_intv_ );
  }
}
