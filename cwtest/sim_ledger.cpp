#include "sim_ledger.hpp"
#include <cw/tx.hpp>
#include <write_account/write_account.h>
#include <vector>

using namespace cw;

// compact-u16 length
static bool read_len( const uint8_t *&ptr, const uint8_t *end, size_t& res )
{
  res = 0;
  for( unsigned i = 0; i != 3; ++i ) {
    if ( ptr == end ) {
      return false;
    }
    uint8_t b = *ptr++;
    res |= (size_t)( b & 0x7f ) << ( 7*i );
    if ( !( b & 0x80 ) ) {
      return true;
    }
  }
  return false;
}

sim_ledger::sim_ledger()
: fail_from_( UINT64_MAX ),
  fail_reads_( 0 ),
  slot_( 0 ),
  num_sub_( 0 ),
  num_exec_( 0 ),
  num_writes_( 0 ),
  ix_writes_( 0 )
{
}

void sim_ledger::set_program_id( const pub_key& gpub )
{
  gpub_ = gpub;
}

void sim_ledger::fund( const pub_key& acc, uint64_t lamports )
{
  std::lock_guard<std::mutex> lock( mtx_ );
  account_info& info = accs_[acc];
  info.exists_ = true;
  info.lamports_ += lamports;
}

void sim_ledger::drop_at( uint64_t idx )
{
  std::lock_guard<std::mutex> lock( mtx_ );
  drops_.insert( idx );
}

void sim_ledger::lose_at( uint64_t idx )
{
  std::lock_guard<std::mutex> lock( mtx_ );
  loses_.insert( idx );
}

void sim_ledger::set_fail_from( uint64_t idx )
{
  std::lock_guard<std::mutex> lock( mtx_ );
  fail_from_ = idx;
}

void sim_ledger::fail_reads( unsigned num )
{
  std::lock_guard<std::mutex> lock( mtx_ );
  fail_reads_ = num;
}

void sim_ledger::clear_faults()
{
  std::lock_guard<std::mutex> lock( mtx_ );
  drops_.clear();
  loses_.clear();
  fail_from_ = UINT64_MAX;
  fail_reads_ = 0;
}

void sim_ledger::expire_block_hashes()
{
  std::lock_guard<std::mutex> lock( mtx_ );
  bhash_.clear();
}

uint64_t sim_ledger::get_num_submitted() const
{
  std::lock_guard<std::mutex> lock( mtx_ );
  return num_sub_;
}

uint64_t sim_ledger::get_num_executed() const
{
  std::lock_guard<std::mutex> lock( mtx_ );
  return num_exec_;
}

uint64_t sim_ledger::get_num_writes() const
{
  std::lock_guard<std::mutex> lock( mtx_ );
  return num_writes_;
}

const account_info *sim_ledger::find_account( const pub_key& acc ) const
{
  std::lock_guard<std::mutex> lock( mtx_ );
  acc_map_t::const_iterator it = accs_.find( acc );
  return it != accs_.end() ? &it->second : nullptr;
}

uint64_t sim_ledger::get_balance( const pub_key& acc ) const
{
  const account_info *info = find_account( acc );
  return info ? info->lamports_ : 0;
}

bool sim_ledger::get_block_hash( hash& bhash )
{
  std::lock_guard<std::mutex> lock( mtx_ );
  uint8_t buf[hash::len];
  __builtin_memset( buf, 0, hash::len );
  ++slot_;
  __builtin_memcpy( buf, &slot_, sizeof( slot_ ) );
  buf[hash::len-1] = 0xbb;
  bhash.init_from_buf( buf );
  bhash_.insert( bhash );
  return true;
}

bool sim_ledger::get_rent_exempt( uint64_t data_len, uint64_t& lamports )
{
  // two years of rent at the default lamports per byte-year
  lamports = ( 128UL + data_len ) * 3480UL * 2UL;
  return true;
}

bool sim_ledger::get_account( const pub_key& acc, account_info& info )
{
  std::lock_guard<std::mutex> lock( mtx_ );
  reset_err();
  if ( fail_reads_ ) {
    --fail_reads_;
    return set_err( e_err_transient, 0, "rpc request timed out" );
  }
  acc_map_t::const_iterator it = accs_.find( acc );
  if ( it == accs_.end() ) {
    info = account_info();
  } else {
    info = it->second;
  }
  return true;
}

bool sim_ledger::send_transaction( const char *buf, size_t len )
{
  std::lock_guard<std::mutex> lock( mtx_ );
  reset_err();
  uint64_t idx = num_sub_++;
  if ( idx >= fail_from_ || drops_.count( idx ) ) {
    return set_err( e_err_transient, 0, "transaction dropped" );
  }
  if ( len > CW_TX_MAX_SIZE ) {
    return set_err( e_err_invalid, 0, "transaction too large" );
  }
  acc_map_t accs;
  std::string sig;
  ix_writes_ = 0;
  if ( !execute( (const uint8_t*)buf, len, accs, sig ) ) {
    return false;
  }

  // commit. accounts left without lamports are removed
  for( acc_map_t::iterator it = accs.begin(); it != accs.end(); ++it ) {
    if ( !it->second.exists_ ) {
      continue;
    }
    if ( it->second.lamports_ == 0 ) {
      accs_.erase( it->first );
    } else {
      accs_[it->first] = it->second;
    }
  }
  sigs_.insert( sig );
  ++num_exec_;
  num_writes_ += ix_writes_;
  if ( loses_.count( idx ) ) {
    return set_err( e_err_transient, 0,
        "transaction not confirmed before timeout" );
  }
  return true;
}

bool sim_ledger::execute( const uint8_t *buf, size_t len,
                          acc_map_t& accs, std::string& sid )
{
  const uint8_t *ptr = buf, *end = buf + len;
  size_t nsig = 0;
  if ( !read_len( ptr, end, nsig ) || nsig == 0 ||
       (size_t)( end - ptr ) < nsig * signature::len + 3 ) {
    return set_err( e_err_invalid, 0, "malformed transaction" );
  }
  const uint8_t *sptr = ptr;
  ptr += nsig * signature::len;
  const uint8_t *msg = ptr;
  size_t nreq = ptr[0];
  ptr += 3;
  size_t nkeys = 0;
  if ( !read_len( ptr, end, nkeys ) || nreq != nsig || nkeys < nreq ||
       (size_t)( end - ptr ) < ( nkeys + 1 ) * pub_key::len ) {
    return set_err( e_err_invalid, 0, "malformed transaction" );
  }
  std::vector<pub_key> keys( nkeys );
  for( size_t i = 0; i != nkeys; ++i ) {
    keys[i].init_from_buf( ptr );
    ptr += pub_key::len;
  }
  hash rhash;
  rhash.init_from_buf( ptr );
  ptr += hash::len;

  // every required signer signs the whole message
  for( size_t i = 0; i != nsig; ++i ) {
    signature sig;
    sig.init_from_buf( &sptr[i*signature::len] );
    if ( !sig.verify( msg, end - msg, keys[i] ) ) {
      return set_err( e_err_invalid, 0, "signature verification failure" );
    }
  }
  if ( !bhash_.count( rhash ) ) {
    return set_err( e_err_transient, 0, "BlockhashNotFound" );
  }
  sid.assign( (const char*)sptr, signature::len );
  if ( sigs_.count( sid ) ) {
    return set_err( e_err_transient, 0, "AlreadyProcessed" );
  }
  for( size_t i = 0; i != nkeys; ++i ) {
    acc_map_t::const_iterator it = accs_.find( keys[i] );
    if ( it != accs_.end() ) {
      accs[keys[i]] = it->second;
    }
  }

  size_t nix = 0;
  if ( !read_len( ptr, end, nix ) ) {
    return set_err( e_err_invalid, 0, "malformed transaction" );
  }
  for( size_t i = 0; i != nix; ++i ) {
    size_t nacc = 0, dlen = 0;
    if ( ptr == end ) {
      return set_err( e_err_invalid, 0, "malformed transaction" );
    }
    size_t pidx = *ptr++;
    if ( !read_len( ptr, end, nacc ) || (size_t)( end - ptr ) < nacc ) {
      return set_err( e_err_invalid, 0, "malformed transaction" );
    }
    const uint8_t *aidx = ptr;
    ptr += nacc;
    if ( !read_len( ptr, end, dlen ) || (size_t)( end - ptr ) < dlen ) {
      return set_err( e_err_invalid, 0, "malformed transaction" );
    }
    const uint8_t *data = ptr;
    ptr += dlen;
    if ( pidx >= nkeys ) {
      return set_err( e_err_invalid, 0, "malformed transaction" );
    }
    for( size_t j = 0; j != nacc; ++j ) {
      if ( aidx[j] >= nkeys ) {
        return set_err( e_err_invalid, 0, "malformed transaction" );
      }
    }
    const pub_key& prog = keys[pidx];
    bool ok;
    if ( nacc < 2 ) {
      ok = set_err( e_err_protocol, CW_BUILTIN_ERR_CODE,
          "NotEnoughAccountKeys" );
    } else if ( prog.is_zero() ) {
      ok = create_account( accs, keys[aidx[0]], keys[aidx[1]],
          aidx[0] < nreq && aidx[1] < nreq, data, dlen );
    } else if ( prog == gpub_ ) {
      ok = write_account( accs, keys[aidx[0]], keys[aidx[1]],
          aidx[0] < nreq, data, dlen );
    } else {
      ok = set_err( e_err_protocol, CW_BUILTIN_ERR_CODE,
          "ProgramAccountNotFound" );
    }
    if ( !ok ) {
      set_err( e_err_protocol, get_err_code(),
          "instruction " + std::to_string( i ) + " failed: " +
          get_err_msg() );
      set_err_ix( (int)i );
      return false;
    }
  }
  if ( ptr != end ) {
    return set_err( e_err_invalid, 0, "malformed transaction" );
  }
  return true;
}

bool sim_ledger::create_account( acc_map_t& accs, const pub_key& from,
                                 const pub_key& to, bool is_signed,
                                 const uint8_t *data, size_t dlen )
{
  if ( !is_signed ) {
    return set_err( e_err_protocol, CW_BUILTIN_ERR_CODE,
        "MissingRequiredSignature" );
  }
  uint32_t cmd = 0;
  if ( dlen == 52 ) {
    __builtin_memcpy( &cmd, data, sizeof( cmd ) );
  }
  if ( dlen != 52 || cmd != 0 ) {
    return set_err( e_err_protocol, CW_BUILTIN_ERR_CODE,
        "InvalidInstructionData" );
  }
  uint64_t lamports = 0, space = 0;
  __builtin_memcpy( &lamports, &data[4], sizeof( lamports ) );
  __builtin_memcpy( &space, &data[12], sizeof( space ) );
  pub_key owner;
  owner.init_from_buf( &data[20] );

  // system program custom errors
  account_info& dst = accs[to];
  if ( dst.exists_ ) {
    return set_err( e_err_protocol, 0, "AccountAlreadyInUse" );
  }
  if ( space > CW_MAX_ACCOUNT_SIZE ) {
    return set_err( e_err_protocol, 3, "InvalidAccountDataLength" );
  }
  account_info& src = accs[from];
  if ( !src.exists_ || src.lamports_ < lamports ) {
    return set_err( e_err_protocol, 1, "ResultWithNegativeLamports" );
  }
  src.lamports_ -= lamports;
  dst.exists_    = true;
  dst.lamports_  = lamports;
  dst.owner_     = owner;
  dst.data_.assign( space, 0 );
  return true;
}

bool sim_ledger::write_account( acc_map_t& accs, const pub_key& writer,
                                const pub_key& acc, bool is_signed,
                                const uint8_t *data, size_t dlen )
{
  acc_map_t::iterator it = accs.find( acc );
  if ( it == accs.end() || !it->second.exists_ ||
       it->second.owner_ != gpub_ ) {
    return set_err( e_err_protocol, CW_BUILTIN_ERR_CODE,
        "IncorrectProgramId" );
  }
  cw_pub_key_t signer[1];
  cw_pub_key_assign( signer, writer.data() );
  std::vector<uint8_t>& buf = it->second.data_;
  uint64_t rc = cw_process( buf.data(), buf.size(),
                            is_signed ? signer : nullptr, data, dlen );
  if ( rc != CW_SUCCESS ) {
    return set_err( e_err_protocol, rc,
        "custom program error " + std::to_string( rc ) );
  }
  if ( data[0] == e_cmd_write ) {
    ++ix_writes_;
  } else if ( data[0] == e_cmd_close ) {
    account_info& dst = accs[writer];
    dst.exists_ = true;
    dst.lamports_ += it->second.lamports_;
    it->second.lamports_ = 0;
  }
  return true;
}
