#include <cw/uploader.hpp>
#include <cw/rpc_ledger.hpp>
#include <cw/key_store.hpp>
#include <cw/mem_map.hpp>
#include <cw/log.hpp>
#include <write_account/write_account.h>

#include <unistd.h>
#include <stdlib.h>
#include <signal.h>
#include <iostream>

// write_account command-line tool

using namespace cw;

static const std::string DEFAULT_RPC_HOST  = "localhost";
static const std::string DEFAULT_KEY_STORE = std::string(
    getenv( "HOME" ) ? getenv( "HOME" ) : "." ) + "/.chunkwrite/";

int usage()
{
  using namespace std;
  cerr << "usage: write_account" << endl;
  cerr << "  init_key         [options]" << endl;
  cerr << "  upload           <target_program> <file> [options]" << endl;
  cerr << "  resume           <chunk_account> <target_program> <file> [options]" << endl;
  cerr << "  status           <chunk_account> [options]" << endl;
  cerr << "  invoke           <target_program> <chunk_account> [options]" << endl;
  cerr << "  close            <chunk_account> [options]" << endl;
  cerr << "  version" << endl;
  cerr << endl;

  cerr << "options include:" << endl;
  cerr << "  -r <rpc_host (default " << DEFAULT_RPC_HOST << ")>" << endl;
  cerr << "     Host name or IP address of solana rpc node in the form "
               "host_name[:rpc_port]\n" << endl;
  cerr << "  -k <key_store_directory (default " << DEFAULT_KEY_STORE << ")>" << endl;
  cerr << "     Directory name housing writer, program and chunk account"
               " key files\n" << endl;
  cerr << "  -p <write_account_program_id>" << endl;
  cerr << "     Defaults to the key in program_key.json in the key store\n"
       << endl;
  cerr << "  -c <commitment_level (default confirmed)>" << endl;
  cerr << "     Options include processed, confirmed and finalized\n" << endl;
  cerr << "  -d" << endl;
  cerr << "     Turn on debug logging\n" << endl;
  cerr << "  -h" << endl;
  cerr << "     Output this help text\n" << endl;

  cerr << "options only for upload / resume include:" << endl;
  cerr << "  -l <transaction size limit (default " << CW_TX_MAX_SIZE << ")>"
       << endl;
  cerr << "  -s <max chunk size>" << endl;
  cerr << "  -n <max retries without progress (default 5)>" << endl;
  cerr << "  -t <deadline in seconds>" << endl;
  return 1;
}

struct cw_arguments
{
  cw_arguments( int argc, char **argv );

  bool         invalid_     = false;
  std::string  rpc_host_    = DEFAULT_RPC_HOST;
  std::string  key_dir_     = DEFAULT_KEY_STORE;
  std::string  program_id_;
  commitment   cmt_         = commitment::e_confirmed;
  size_t       tx_limit_    = CW_TX_MAX_SIZE;
  size_t       max_chunk_   = 0;
  unsigned     max_retries_ = 5;
  int64_t      deadline_    = 0;
};

cw_arguments::cw_arguments( int argc, char **argv )
{
  int opt = 0;
  while ( (opt = ::getopt( argc, argv, "r:k:p:c:l:s:n:t:dh" )) != -1 ) {
    switch (opt) {
      case 'r': rpc_host_ = optarg; break;
      case 'k': key_dir_ = optarg; break;
      case 'p': program_id_ = optarg; break;
      case 'c': cmt_ = str_to_commitment( optarg ); break;
      case 'l': tx_limit_ = ::atoi( optarg ); break;
      case 's': max_chunk_ = ::atoi( optarg ); break;
      case 'n': max_retries_ = ::atoi( optarg ); break;
      case 't': deadline_ = ::atoi( optarg ); break;
      case 'd': log::set_level( CW_LOG_DBG_LVL ); break;
      default:
        usage();
        invalid_ = true;
    }
  }

  if ( cmt_ == commitment::e_unknown ) {
    std::cerr << "write_account: unknown commitment level" << std::endl;
    invalid_ = true;
    usage();
  }
}

// key store and rpc connection shared by all chain commands
struct cw_session
{
  bool init( const cw_arguments& );

  key_store  kst_;
  rpc_ledger lgr_;
  key_pair  *wkey_ = nullptr;
  pub_key    gpub_;
};

bool cw_session::init( const cw_arguments& args )
{
  kst_.set_dir( args.key_dir_ );
  if ( !kst_.init() ) {
    std::cerr << "write_account: " << kst_.get_err_msg() << std::endl;
    return false;
  }
  if ( !(wkey_ = kst_.get_writer_key_pair() ) ) {
    std::cerr << "write_account: " << kst_.get_err_msg() << std::endl;
    return false;
  }
  if ( !args.program_id_.empty() ) {
    if ( !gpub_.init_from_text( args.program_id_ ) ) {
      std::cerr << "write_account: invalid program id" << std::endl;
      return false;
    }
  } else {
    pub_key *gpub = kst_.get_program_pub_key();
    if ( !gpub ) {
      std::cerr << "write_account: " << kst_.get_err_msg() << std::endl;
      return false;
    }
    gpub_ = *gpub;
  }
  lgr_.set_rpc_host( args.rpc_host_ );
  lgr_.set_commitment( args.cmt_ );
  if ( !lgr_.init() ) {
    std::cerr << "write_account: " << lgr_.get_err_msg() << std::endl;
    return false;
  }
  return true;
}

static bool init_uploader( uploader& upl, cw_session& ses,
                           const cw_arguments& args )
{
  upl.set_ledger( &ses.lgr_ );
  upl.set_writer( ses.wkey_ );
  upl.set_program_id( ses.gpub_ );
  upl.set_max_retries( args.max_retries_ );
  if ( args.max_chunk_ ) {
    upl.set_max_chunk( args.max_chunk_ );
  }
  if ( !upl.set_tx_limit( args.tx_limit_ ) ) {
    std::cerr << "write_account: " << upl.get_err_msg() << std::endl;
    return false;
  }
  return true;
}

static bool read_payload( const std::string& file, upload& u )
{
  mem_map mp;
  mp.set_file( file );
  if ( !mp.init() ) {
    std::cerr << "write_account: failed to read file=" << file << std::endl;
    return false;
  }
  u.set_payload( (const uint8_t*)mp.data(), mp.size() );
  return true;
}

static int on_upload_result( bool ok, uploader& upl, const upload& u )
{
  if ( !ok ) {
    std::cerr << "write_account: " << err_kind_name( upl.get_err_kind() )
              << " error: " << upl.get_err_msg() << std::endl;
    std::cerr << "write_account: written " << u.get_written() << " of "
              << u.get_payload().size() << " bytes, resume with account "
              << u.get_chunk_account().as_string() << std::endl;
    return 1;
  }
  std::cout << u.get_chunk_account().as_string() << std::endl;
  return 0;
}

int on_init_key( int argc, char **argv )
{
  cw_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  key_store kst;
  kst.set_dir( args.key_dir_ );
  if ( !kst.create() || !kst.init() ) {
    std::cerr << "write_account: " << kst.get_err_msg() << std::endl;
    return 1;
  }
  if ( kst.get_writer_key_pair() ) {
    std::cerr << "write_account: writer key pair already exists ["
      << kst.get_writer_key_pair_file() << "]" << std::endl;
    return 1;
  }
  if ( !kst.create_writer_key_pair() ) {
    std::cerr << "write_account: failed to create writer key pair ["
      << kst.get_writer_key_pair_file() << "]" << std::endl;
    std::cerr << "write_account: " << kst.get_err_msg() << std::endl;
    return 1;
  }
  std::cout << kst.get_writer_pub_key()->as_string() << std::endl;
  return 0;
}

int on_upload( int argc, char **argv )
{
  if ( argc < 3 ) {
    return usage();
  }
  pub_key target;
  if ( !target.init_from_text( std::string( argv[1] ) ) ) {
    std::cerr << "write_account: invalid target program" << std::endl;
    return 1;
  }
  std::string file( argv[2] );
  argc -= 2;
  argv += 2;
  cw_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  upload u;
  u.set_target( target );
  if ( !read_payload( file, u ) ) {
    return 1;
  }
  cw_session ses;
  uploader upl;
  if ( !ses.init( args ) || !init_uploader( upl, ses, args ) ) {
    return 1;
  }

  // persist the chunk account key first so the upload can be resumed
  key_pair ckey;
  if ( !ses.kst_.create_account_key_pair( ckey ) ) {
    std::cerr << "write_account: " << ses.kst_.get_err_msg() << std::endl;
    return 1;
  }
  u.set_chunk_key_pair( ckey );

  cancel_token ctok;
  if ( args.deadline_ ) {
    ctok.set_deadline( get_now() + args.deadline_ * CW_NSECS_IN_SEC );
    upl.set_cancel_token( &ctok );
  }
  bool ok = upl.begin_upload( u );
  return on_upload_result( ok, upl, u );
}

int on_resume( int argc, char **argv )
{
  if ( argc < 4 ) {
    return usage();
  }
  pub_key acc, target;
  if ( !acc.init_from_text( std::string( argv[1] ) ) ||
       !target.init_from_text( std::string( argv[2] ) ) ) {
    std::cerr << "write_account: invalid account key" << std::endl;
    return 1;
  }
  std::string file( argv[3] );
  argc -= 3;
  argv += 3;
  cw_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  upload u;
  u.set_target( target );
  if ( !read_payload( file, u ) ) {
    return 1;
  }
  cw_session ses;
  uploader upl;
  if ( !ses.init( args ) || !init_uploader( upl, ses, args ) ) {
    return 1;
  }
  key_pair ckey;
  if ( !ses.kst_.get_account_key_pair( acc, ckey ) ) {
    std::cerr << "write_account: " << ses.kst_.get_err_msg() << std::endl;
    return 1;
  }
  u.set_chunk_key_pair( ckey );
  u.set_is_created( ses.kst_.get_is_account_closed( acc ) );

  cancel_token ctok;
  if ( args.deadline_ ) {
    ctok.set_deadline( get_now() + args.deadline_ * CW_NSECS_IN_SEC );
    upl.set_cancel_token( &ctok );
  }
  bool ok = upl.resume( u );
  return on_upload_result( ok, upl, u );
}

int on_status( int argc, char **argv )
{
  if ( argc < 2 ) {
    return usage();
  }
  pub_key acc;
  if ( !acc.init_from_text( std::string( argv[1] ) ) ) {
    std::cerr << "write_account: invalid account key" << std::endl;
    return 1;
  }
  argc -= 1;
  argv += 1;
  cw_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  cw_session ses;
  uploader upl;
  if ( !ses.init( args ) || !init_uploader( upl, ses, args ) ) {
    return 1;
  }
  key_pair ckey;
  if ( !ses.kst_.get_account_key_pair( acc, ckey ) ) {
    std::cerr << "write_account: " << ses.kst_.get_err_msg() << std::endl;
    return 1;
  }
  upload u;
  u.set_chunk_key_pair( ckey );
  u.set_is_created( ses.kst_.get_is_account_closed( acc ) );
  if ( !upl.status( u ) ) {
    std::cerr << "write_account: " << upl.get_err_msg() << std::endl;
    return 1;
  }
  std::cout << "account   " << acc.as_string() << std::endl;
  std::cout << "state     " << upload_state_name( u.get_state() ) << std::endl;
  if ( u.get_state() == e_upload_writing ||
       u.get_state() == e_upload_complete ) {
    std::cout << "written   " << u.get_written() << std::endl;
    std::cout << "total_len " << u.get_total_len() << std::endl;
  }
  return 0;
}

int on_invoke( int argc, char **argv )
{
  if ( argc < 3 ) {
    return usage();
  }
  pub_key target, acc;
  if ( !target.init_from_text( std::string( argv[1] ) ) ||
       !acc.init_from_text( std::string( argv[2] ) ) ) {
    std::cerr << "write_account: invalid account key" << std::endl;
    return 1;
  }
  argc -= 2;
  argv += 2;
  cw_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  cw_session ses;
  if ( !ses.init( args ) ) {
    return 1;
  }
  hash bhash;
  if ( !ses.lgr_.get_block_hash( bhash ) ) {
    std::cerr << "write_account: " << ses.lgr_.get_err_msg() << std::endl;
    return 1;
  }
  char buf[CW_TX_MAX_SIZE];
  bincode tx( buf );
  if ( !tx::invoke_with_account( tx, bhash, *ses.wkey_, target, acc ) ) {
    std::cerr << "write_account: failed to build transaction" << std::endl;
    return 1;
  }
  if ( !ses.lgr_.send_transaction( tx.get_buf(), tx.size() ) ) {
    std::cerr << "write_account: " << ses.lgr_.get_err_msg() << std::endl;
    return 1;
  }
  signature sig;
  tx::get_signature( tx, sig );
  std::string sstr;
  sig.enc_base58( sstr );
  std::cout << sstr << std::endl;
  return 0;
}

int on_close( int argc, char **argv )
{
  if ( argc < 2 ) {
    return usage();
  }
  pub_key acc;
  if ( !acc.init_from_text( std::string( argv[1] ) ) ) {
    std::cerr << "write_account: invalid account key" << std::endl;
    return 1;
  }
  argc -= 1;
  argv += 1;
  cw_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  cw_session ses;
  uploader upl;
  if ( !ses.init( args ) || !init_uploader( upl, ses, args ) ) {
    return 1;
  }
  key_pair ckey;
  if ( !ses.kst_.get_account_key_pair( acc, ckey ) ) {
    std::cerr << "write_account: " << ses.kst_.get_err_msg() << std::endl;
    return 1;
  }
  upload u;
  u.set_chunk_key_pair( ckey );
  u.set_is_created( ses.kst_.get_is_account_closed( acc ) );
  if ( !upl.close( u ) ) {
    std::cerr << "write_account: " << upl.get_err_msg() << std::endl;
    return 1;
  }
  if ( !ses.kst_.mark_account_closed( acc ) ) {
    std::cerr << "write_account: " << ses.kst_.get_err_msg() << std::endl;
    return 1;
  }
  return 0;
}

int main(int argc, char **argv)
{
  if ( argc < 2 ) {
    return usage();
  }
  --argc;
  ++argv;

  // set up signal handing
  signal( SIGPIPE, SIG_IGN );
  log::set_level( CW_LOG_INF_LVL );

  // dispatch by command
  std::string cmd( argv[0] );
  int rc = 0;
  if ( cmd == "init_key" ) {
    rc = on_init_key( argc, argv );
  } else if ( cmd == "upload" ) {
    rc = on_upload( argc, argv );
  } else if ( cmd == "resume" ) {
    rc = on_resume( argc, argv );
  } else if ( cmd == "status" ) {
    rc = on_status( argc, argv );
  } else if ( cmd == "invoke" ) {
    rc = on_invoke( argc, argv );
  } else if ( cmd == "close" ) {
    rc = on_close( argc, argv );
  } else if ( cmd == "version" ) {
    std::cout << "version: " << CW_VERSION << std::endl;
  } else {
    std::cerr << "write_account: unknown command" << std::endl;
    rc = usage();
  }
  return rc;
}
