#include <cw/chunk_plan.hpp>
#include "test_error.hpp"
#include <vector>

using namespace cw;

// concatenate plan from offset
std::vector<uint8_t> collect( const chunk_plan& plan, uint64_t from,
                              size_t& num )
{
  std::vector<uint8_t> res;
  num = 0;
  chunk c;
  for( bool ok = plan.first( c, from ); ok; ok = plan.next( c ) ) {
    CW_TEST_CHECK( c.off_ == from + res.size() );
    CW_TEST_CHECK( c.len_ > 0 && c.len_ <= plan.get_chunk_size() );
    res.insert( res.end(), c.buf_, c.buf_ + c.len_ );
    ++num;
  }
  return res;
}

void test_limits()
{
  chunk_plan plan;
  CW_TEST_CHECK( plan.get_tx_limit() == CW_TX_MAX_SIZE );
  CW_TEST_CHECK( plan.get_chunk_size() == 1019 );

  // no room for payload
  CW_TEST_CHECK( !plan.set_tx_limit( CW_TX_WRITE_OVERHEAD ) );
  CW_TEST_CHECK( plan.get_err_kind() == e_err_invalid );
  CW_TEST_CHECK( !plan.set_tx_limit( 10 ) );
  CW_TEST_CHECK( !plan.set_tx_limit( CW_TX_MAX_SIZE + 1 ) );
  CW_TEST_CHECK( plan.get_tx_limit() == CW_TX_MAX_SIZE );

  CW_TEST_CHECK( plan.set_tx_limit( CW_TX_WRITE_OVERHEAD + 1 ) );
  CW_TEST_CHECK( plan.get_chunk_size() == 1 );
  CW_TEST_CHECK( plan.set_tx_limit( 1000 ) );
  CW_TEST_CHECK( plan.get_chunk_size() == 1000 - CW_TX_WRITE_OVERHEAD );

  // caller cap is clamped to [1, C]
  plan.set_max_chunk( 100 );
  CW_TEST_CHECK( plan.get_chunk_size() == 100 );
  plan.set_max_chunk( 5000 );
  CW_TEST_CHECK( plan.get_chunk_size() == 1000 - CW_TX_WRITE_OVERHEAD );
  plan.set_max_chunk( 0 );
  CW_TEST_CHECK( plan.get_chunk_size() == 1 );
}

void test_alphabet()
{
  const char *txt = "abcdefghijklmnopqrstuvwxyz";
  chunk_plan plan;
  plan.set_payload( (const uint8_t*)txt, 26 );
  CW_TEST_CHECK( plan.set_tx_limit( CW_TX_WRITE_OVERHEAD + 13 ) );
  CW_TEST_CHECK( plan.get_num_chunks() == 2 );

  chunk c;
  CW_TEST_CHECK( plan.first( c ) );
  CW_TEST_CHECK( c.off_ == 0 && c.len_ == 13 );
  CW_TEST_CHECK( 0 == __builtin_memcmp( c.buf_, "abcdefghijklm", 13 ) );
  CW_TEST_CHECK( plan.next( c ) );
  CW_TEST_CHECK( c.off_ == 13 && c.len_ == 13 );
  CW_TEST_CHECK( 0 == __builtin_memcmp( c.buf_, "nopqrstuvwxyz", 13 ) );
  CW_TEST_CHECK( !plan.next( c ) );

  // single chunk at the default limit
  plan.set_tx_limit( CW_TX_MAX_SIZE );
  CW_TEST_CHECK( plan.get_num_chunks() == 1 );
  CW_TEST_CHECK( plan.first( c ) && c.len_ == 26 );
}

void test_round_trip()
{
  std::vector<uint8_t> pay( 10000 );
  for( size_t i = 0; i != pay.size(); ++i ) {
    pay[i] = (uint8_t)( i * 31 + 17 );
  }
  const size_t limits[] = { 214, 300, 1000, 1231, 1232 };
  const size_t lens[] = { 0, 1, 1018, 1019, 1020, 2038, 9999, 10000 };
  for( size_t limit : limits ) {
    for( size_t len : lens ) {
      chunk_plan plan;
      plan.set_payload( pay.data(), len );
      CW_TEST_CHECK( plan.set_tx_limit( limit ) );
      size_t csz = limit - CW_TX_WRITE_OVERHEAD;
      size_t num = 0;
      std::vector<uint8_t> res = collect( plan, 0, num );
      CW_TEST_CHECK( res.size() == len );
      CW_TEST_CHECK( 0 == len ||
          0 == __builtin_memcmp( res.data(), pay.data(), len ) );
      CW_TEST_CHECK( num == ( len + csz - 1 ) / csz );
      CW_TEST_CHECK( num == plan.get_num_chunks() );

      // deterministic
      size_t num2 = 0;
      CW_TEST_CHECK( collect( plan, 0, num2 ) == res && num2 == num );
    }
  }
}

void test_restart()
{
  std::vector<uint8_t> pay( 5000 );
  for( size_t i = 0; i != pay.size(); ++i ) {
    pay[i] = (uint8_t)i;
  }
  chunk_plan plan;
  plan.set_payload( pay.data(), pay.size() );
  size_t csz = plan.get_chunk_size();

  // resuming on a boundary reproduces the remaining chunks
  chunk c, d;
  CW_TEST_CHECK( plan.first( c ) && plan.next( c ) && plan.next( c ) );
  CW_TEST_CHECK( plan.first( d, 2 * csz ) );
  CW_TEST_CHECK( c.off_ == d.off_ && c.len_ == d.len_ && c.buf_ == d.buf_ );

  // mid-chunk restart finishes the chunk then rejoins the plan
  CW_TEST_CHECK( plan.first( d, csz + 5 ) );
  CW_TEST_CHECK( d.off_ == csz + 5 && d.len_ == csz - 5 );
  CW_TEST_CHECK( plan.next( d ) );
  CW_TEST_CHECK( d.off_ == 2 * csz && d.len_ == csz );
  size_t num = 0;
  std::vector<uint8_t> res = collect( plan, csz + 5, num );
  CW_TEST_CHECK( res.size() == pay.size() - csz - 5 );
  CW_TEST_CHECK( 0 == __builtin_memcmp(
        res.data(), &pay[csz + 5], res.size() ) );

  // nothing left at or past the end
  CW_TEST_CHECK( !plan.first( d, pay.size() ) );
  CW_TEST_CHECK( !plan.first( d, pay.size() + 1 ) );
}

void test_large()
{
  // payload far larger than one transaction
  const char *txt = "abcdefghijklmnopqrstuvwxyz";
  std::vector<uint8_t> pay;
  for( unsigned i = 0; i != 40000; ++i ) {
    pay.insert( pay.end(), txt, txt + 26 );
  }
  chunk_plan plan;
  plan.set_payload( pay.data(), pay.size() );
  CW_TEST_CHECK( plan.get_num_chunks() ==
      ( pay.size() + 1018 ) / 1019 );
  size_t num = 0;
  CW_TEST_CHECK( collect( plan, 0, num ) == pay );
  CW_TEST_CHECK( num == 1021 );
}

int main( int, char** )
{
  CW_TEST_START
  test_limits();
  test_alphabet();
  test_round_trip();
  test_restart();
  test_large();
  CW_TEST_END
  return 0;
}
