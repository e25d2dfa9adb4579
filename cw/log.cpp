#include "log.hpp"
#include "misc.hpp"
#include <unistd.h>
#include <stdio.h>
#include <atomic>
#include <condition_variable>
#include <thread>
#include <mutex>
#include <iostream>
#include <algorithm>

namespace cw
{

  // background writer of completed log lines
  class log_impl
  {
  public:
    log_impl();
    ~log_impl();
    void start();
    void stop();
    void run();
    void add( std::string& line );

  private:
    typedef std::vector<std::string> line_vec_t;
    bool        is_run_;
    std::mutex  mtx_;
    std::condition_variable cv_;
    std::thread thrd_;
    line_vec_t  logv_;
  };

}

using namespace cw;

log_impl::log_impl()
: is_run_( false )
{
}

log_impl::~log_impl()
{
  stop();
}

void log_impl::start()
{
  std::lock_guard<std::mutex> lck( mtx_ );
  if ( !thrd_.joinable() ) {
    is_run_ = true;
    thrd_ = std::thread( &log_impl::run, this );
  }
}

// pending lines are flushed before the thread exits
void log_impl::stop()
{
  {
    std::lock_guard<std::mutex> lck( mtx_ );
    is_run_ = false;
  }
  cv_.notify_one();
  if ( thrd_.joinable() ) {
    thrd_.join();
  }
}

void log_impl::add( std::string& line )
{
  {
    std::lock_guard<std::mutex> lck( mtx_ );
    logv_.emplace_back();
    logv_.back().swap( line );
  }
  cv_.notify_one();
}

void log_impl::run()
{
  line_vec_t logv;
  std::unique_lock<std::mutex> lck( mtx_ );
  for(;;) {
    cv_.wait( lck, [this]{ return !logv_.empty() || !is_run_; } );
    if ( logv_.empty() ) {
      break;
    }
    logv.swap( logv_ );
    lck.unlock();
    for( const std::string& line: logv ) {
      std::cerr << line << '\n';
    }
    std::cerr.flush();
    logv.clear();
    lck.lock();
  }
}

int log::level_ = 0;
static log_impl impl_;
static const int log_pid = getpid();

// enable level t and every more severe level
void log::set_level( int t )
{
  int lvl = CW_LOG_ERR_LVL;
  while( lvl < t ) {
    lvl = ( lvl << 1 ) | 1;
  }
  level_ = lvl;
  impl_.start();
}

log_line log::add( str topic, int level )
{
  return log_line( topic, level );
}

static const char *level_name( int lvl )
{
  switch( lvl ) {
    case CW_LOG_DBG_LVL: return "DBG";
    case CW_LOG_INF_LVL: return "INF";
    case CW_LOG_WRN_LVL: return "WRN";
    case CW_LOG_ERR_LVL: return "ERR";
  }
  return "???";
}

void log_wtr::add_i64( int64_t val )
{
  char buf[32], *end = &buf[sizeof(buf)];
  char *cptr = int_to_str( val, end );
  add( str( cptr, end - cptr ) );
}

void log_wtr::add_u64( uint64_t val )
{
  char buf[32], *end = &buf[sizeof(buf)];
  char *cptr = uint_to_str( val, end );
  add( str( cptr, end - cptr ) );
}

// "[<utc time> <pid> <level> <topic padded to 40>] key=val,..."
log_line::log_line( str topic, int lvl )
: is_first_( true )
{
  const size_t topic_len = 40;
  char tbuf[32];
  nsecs_to_utc6( get_now(), tbuf );
  wtr_.add( '[' );
  wtr_.add( str( tbuf, 27 ) );
  wtr_.add( ' ' );
  wtr_.add_i64( log_pid );
  wtr_.add( ' ' );
  wtr_.add( level_name( lvl ) );
  wtr_.add( ' ' );
  size_t len = std::min( topic.len_, topic_len );
  wtr_.add( str( topic.str_, len ) );
  for( ; len < topic_len; ++len ) {
    wtr_.add( ' ' );
  }
  wtr_.add( "] " );
}

void log_line::add_key( str key )
{
  if ( !is_first_ ) {
    wtr_.add( ',' );
  }
  is_first_ = false;
  wtr_.add( key );
  wtr_.add( '=' );
}

log_line& log_line::add( str key, str val )
{
  add_key( key );
  wtr_.add( val );
  return *this;
}

log_line& log_line::add( str key, int32_t val )
{
  return add( key, (int64_t)val );
}

log_line& log_line::add( str key, int64_t val )
{
  add_key( key );
  wtr_.add_i64( val );
  return *this;
}

log_line& log_line::add( str key, uint32_t val )
{
  return add( key, (uint64_t)val );
}

log_line& log_line::add( str key, uint64_t val )
{
  add_key( key );
  wtr_.add_u64( val );
  return *this;
}

log_line& log_line::add( str key, const hash& pk )
{
  return add( key, str( pk.as_string() ) );
}

log_line& log_line::add( str key, const signature& sig )
{
  std::string res;
  sig.enc_base58( res );
  return add( key, str( res ) );
}

// kind and message of a failed operation
log_line& log_line::add( str key, const error& err )
{
  add_key( key );
  wtr_.add( err_kind_name( err.get_err_kind() ) );
  wtr_.add( ':' );
  wtr_.add( err.get_err_msg() );
  return *this;
}

void log_line::end()
{
  std::string line;
  wtr_.detach( line );
  impl_.add( line );
}
