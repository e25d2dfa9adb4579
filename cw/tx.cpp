#include "tx.hpp"
#include <write_account/write_account.h>

static cw::hash gen_sys_id()
{
  cw::hash id;
  id.zero();
  return id;
}

// system program id
static cw::hash sys_id = gen_sys_id();

namespace cw
{
  namespace tx
  {

    enum system_instruction : uint32_t
    {
      e_create_account = 0
    };

    // single writer-signed call of the write-account program on
    // [writer, chunk account]
    static bool writer_call( bincode& msg,
                             const hash& rhash,
                             const key_pair& writer,
                             const pub_key& chunk_acc,
                             const pub_key& program_id,
                             const uint8_t *hdr, size_t hdr_len,
                             const uint8_t *buf, size_t len )
    {
      size_t data_len = hdr_len + len;
      size_t tx_len = CW_TX_WRITE_OVERHEAD - sizeof( cmd_write_t ) -
        2 + bincode::len_size( data_len ) + data_len;
      if ( data_len > 0xffff || tx_len > CW_TX_MAX_SIZE ) {
        return false;
      }

      // signatures section
      msg.add_len<1>();      // one signature
      size_t sign_idx = msg.reserve_sign();

      // message header
      size_t msg_idx = msg.get_pos();
      msg.add( (uint8_t)1 ); // signing accounts
      msg.add( (uint8_t)0 ); // read-only signed accounts
      msg.add( (uint8_t)1 ); // program id is read-only unsigned

      // accounts
      msg.add_len<3>();      // writer, chunk account, program
      msg.add( pub_key( writer ) );
      msg.add( chunk_acc );
      msg.add( program_id );

      // recent block hash
      msg.add( rhash );

      // instructions section
      msg.add_len<1>();      // one instruction
      msg.add( (uint8_t)2 ); // program_id index
      msg.add_len<2>();      // 2 accounts: writer, chunk account
      msg.add( (uint8_t)0 );
      msg.add( (uint8_t)1 );
      msg.add_len( data_len );
      msg.add( hdr, hdr_len );
      if ( len ) {
        msg.add( buf, len );
      }

      return msg.sign( sign_idx, msg_idx, writer );
    }

    bool create_and_initialize( bincode& msg,
                                const hash& rhash,
                                const key_pair& writer,
                                const key_pair& chunk_acc,
                                uint64_t lamports,
                                uint64_t capacity,
                                uint64_t total_len,
                                const pub_key& target_id,
                                const pub_key& program_id )
    {
      // signatures section
      msg.add_len<2>();      // writer and new account both sign
      size_t wrt_idx = msg.reserve_sign();
      size_t acc_idx = msg.reserve_sign();

      // message header
      size_t msg_idx = msg.get_pos();
      msg.add( (uint8_t)2 ); // signing accounts
      msg.add( (uint8_t)0 ); // read-only signed accounts
      msg.add( (uint8_t)2 ); // system and write-account programs

      // accounts
      msg.add_len<4>();
      msg.add( pub_key( writer ) );
      msg.add( pub_key( chunk_acc ) );
      msg.add( sys_id );
      msg.add( program_id );

      // recent block hash
      msg.add( rhash );

      // instructions section
      msg.add_len<2>();

      // create account
      msg.add( (uint8_t)2 ); // system program index
      msg.add_len<2>();      // funding and new account
      msg.add( (uint8_t)0 );
      msg.add( (uint8_t)1 );
      msg.add_len<52>();     // size of data array
      msg.add( (uint32_t)system_instruction::e_create_account );
      msg.add( (uint64_t)lamports );
      msg.add( (uint64_t)( CW_HDR_SIZE + capacity ) );
      msg.add( program_id );

      // initialize
      cmd_initialize_t cmd[1];
      cmd->cmd_       = e_cmd_initialize;
      cmd->capacity_  = capacity;
      cmd->total_len_ = total_len;
      cw_pub_key_assign( &cmd->target_, target_id.data() );
      msg.add( (uint8_t)3 ); // write-account program index
      msg.add_len<2>();      // writer, chunk account
      msg.add( (uint8_t)0 );
      msg.add( (uint8_t)1 );
      msg.add_len<sizeof(cmd_initialize_t)>();
      msg.add( (const uint8_t*)cmd, sizeof( cmd_initialize_t ) );

      // all signers sign the same message
      return msg.sign( wrt_idx, msg_idx, writer ) &&
             msg.sign( acc_idx, msg_idx, chunk_acc );
    }

    bool write( bincode& msg,
                const hash& rhash,
                const key_pair& writer,
                const pub_key& chunk_acc,
                const pub_key& program_id,
                uint64_t offset,
                const uint8_t *buf,
                size_t len )
    {
      cmd_write_t cmd[1];
      cmd->cmd_    = e_cmd_write;
      cmd->offset_ = offset;
      return writer_call( msg, rhash, writer, chunk_acc, program_id,
          (const uint8_t*)cmd, sizeof( cmd_write_t ), buf, len );
    }

    bool close( bincode& msg,
                const hash& rhash,
                const key_pair& writer,
                const pub_key& chunk_acc,
                const pub_key& program_id )
    {
      cmd_close_t cmd[1];
      cmd->cmd_ = e_cmd_close;
      return writer_call( msg, rhash, writer, chunk_acc, program_id,
          (const uint8_t*)cmd, sizeof( cmd_close_t ), nullptr, 0 );
    }

    bool invoke_with_account( bincode& msg,
                              const hash& rhash,
                              const key_pair& payer,
                              const pub_key& target_id,
                              const pub_key& chunk_acc )
    {
      msg.add_len<1>();
      size_t sign_idx = msg.reserve_sign();

      size_t msg_idx = msg.get_pos();
      msg.add( (uint8_t)1 ); // payer signs
      msg.add( (uint8_t)0 );
      msg.add( (uint8_t)2 ); // chunk account and target are read-only

      msg.add_len<3>();
      msg.add( pub_key( payer ) );
      msg.add( chunk_acc );
      msg.add( target_id );

      msg.add( rhash );

      msg.add_len<1>();
      msg.add( (uint8_t)2 ); // target program index
      msg.add_len<1>();      // chunk account only
      msg.add( (uint8_t)1 );
      msg.add_len<0>();      // input comes from the account

      return msg.sign( sign_idx, msg_idx, payer );
    }

    void get_signature( const bincode& msg, signature& sig )
    {
      // skip compact-u16 signature count (always one byte here)
      sig.init_from_buf( (const uint8_t*)&msg.get_buf()[1] );
    }

  }
}
