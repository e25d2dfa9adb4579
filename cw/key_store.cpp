#include "key_store.hpp"
#include "net_socket.hpp"
#include <sys/types.h>
#include <sys/stat.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <stdio.h>

using namespace cw;

key_store::key_store()
: has_wkey_( false ),
  has_gpub_( false )
{
}

void key_store::set_dir( const std::string& dirn )
{
  dir_ = dirn;
}

std::string key_store::get_dir() const
{
  return dir_;
}

bool key_store::write_key_file(
    const std::string& key_file, const key_pair& kp )
{
  json_wtr wtr;
  wtr.add_val( kp );
  std::string txt;
  wtr.copy( txt );
  int fd = ::open( key_file.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0600 );
  if ( fd<0 ) {
    return set_err_msg( "failed to create key file " + key_file, errno );
  }
  const char *buf = txt.c_str();
  size_t len = txt.length();
  while( len ) {
    ssize_t num = ::write( fd, buf, len );
    if ( num < 0 ) {
      int ec = errno;
      ::close( fd );
      return set_err_msg( "failed to write key file " + key_file, ec );
    }
    len -= num;
    buf += num;
  }
  if ( 0 != fchmod( fd, 0400 ) ) {
    int ec = errno;
    ::close( fd );
    return set_err_msg( "failed to chmod key file " + key_file, ec );
  }
  ::close( fd );
  return true;
}

bool key_store::create()
{
  struct stat fst[1];
  if ( 0 == ::stat( dir_.c_str(), fst ) ) {
    if ( 0 != chmod( dir_.c_str(), 0700 ) ) {
      return set_err_msg( "failed to chmod key_store directory", errno );
    }
  } else {
    if ( 0 != mkdir( dir_.c_str(), 0700 ) ) {
      return set_err_msg( "failed to create key_store directory", errno );
    }
  }
  return true;
}

bool key_store::init()
{
  has_wkey_ = has_gpub_ = false;
  struct stat fst[1];
  if ( 0 != ::stat( dir_.c_str(), fst ) ) {
    return set_err_msg( "cant find key_store directory", errno );
  }
  if ( !S_ISDIR(fst->st_mode) ) {
    return set_err_msg( "key_store path not a directory" );
  }
  if ( fst->st_uid != getuid() || fst->st_uid != geteuid() ) {
    return set_err_msg( "user must own the key_store directory" );
  }
  if ( ! (fst->st_mode & S_IRUSR ) || ! (fst->st_mode & S_IWUSR ) ) {
    return set_err_msg(
        "user must have read/write access to key_store directory");
  }
  if ( fst->st_mode & ( S_IRWXG | S_IRWXO ) ) {
    return set_err_msg( "key store directory must be restricted to user "
       "read/write permissions" );
  }
  if ( dir_.back() != '/' ) {
    dir_ += '/';
  }
  return true;
}

std::string key_store::get_writer_key_pair_file() const
{
  return dir_ + "writer_key_pair.json";
}

std::string key_store::get_program_pub_key_file() const
{
  return dir_ + "program_key.json";
}

std::string key_store::get_account_key_pair_file( const pub_key& pk ) const
{
  return dir_ + "account_" + pk.as_string() + ".json";
}

std::string key_store::get_closed_account_key_pair_file(
    const pub_key& pk ) const
{
  return dir_ + "closed_" + pk.as_string() + ".json";
}

key_pair *key_store::create_writer_key_pair()
{
  if ( !wkey_.gen() ) {
    set_err_msg( "failed to generate writer key" );
    return nullptr;
  }
  if ( !write_key_file( get_writer_key_pair_file(), wkey_ ) ) {
    return nullptr;
  }
  wkey_.get_pub_key( wpub_ );
  has_wkey_ = true;
  return &wkey_;
}

key_pair *key_store::get_writer_key_pair()
{
  if ( has_wkey_ ) {
    return &wkey_;
  }
  if ( !wkey_.init_from_file( get_writer_key_pair_file() ) ) {
    set_err_msg( "failed to read " + get_writer_key_pair_file() );
    return nullptr;
  }
  wkey_.get_pub_key( wpub_ );
  has_wkey_ = true;
  return &wkey_;
}

pub_key *key_store::get_writer_pub_key()
{
  if ( get_writer_key_pair() ) {
    return &wpub_;
  }
  return nullptr;
}

pub_key *key_store::get_program_pub_key()
{
  if ( has_gpub_ ) {
    return &gpub_;
  }
  if ( !gpub_.init_from_file( get_program_pub_key_file() ) ) {
    set_err_msg( "failed to read " + get_program_pub_key_file() );
    return nullptr;
  }
  has_gpub_ = true;
  return &gpub_;
}

bool key_store::create_account_key_pair( key_pair& res )
{
  if ( !res.gen() ) {
    return set_err_msg( "failed to generate account key" );
  }
  return write_key_file( get_account_key_pair_file( pub_key( res ) ), res );
}

bool key_store::get_account_key_pair( const pub_key& pk, key_pair& res )
{
  std::string filen = get_is_account_closed( pk ) ?
    get_closed_account_key_pair_file( pk ) : get_account_key_pair_file( pk );
  if ( !res.init_from_file( filen ) ) {
    return set_err_msg( "failed to read " + filen );
  }
  if ( pub_key( res ) != pk ) {
    return set_err_msg( "key pair in " + filen + " does not match" );
  }
  return true;
}

bool key_store::mark_account_closed( const pub_key& pk )
{
  std::string filen = get_account_key_pair_file( pk );
  std::string cfilen = get_closed_account_key_pair_file( pk );
  if ( 0 != ::rename( filen.c_str(), cfilen.c_str() ) ) {
    int ec = errno;
    if ( ec == ENOENT && get_is_account_closed( pk ) ) {
      return true;
    }
    return set_err_msg( "failed to rename key file " + filen, ec );
  }
  return true;
}

bool key_store::get_is_account_closed( const pub_key& pk ) const
{
  struct stat fst[1];
  std::string cfilen = get_closed_account_key_pair_file( pk );
  return 0 == ::stat( cfilen.c_str(), fst );
}
