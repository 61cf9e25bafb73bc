#include <gtest/gtest.h>

#include "../RpgArchive/load_stream.hpp"
#include "../RpgArchive/save_stream.hpp"
#include "test_utils.hpp"

namespace RpgArchive
{

namespace Tests
{

TEST( LoadStreamTest, ReadsLittleEndianValues )
{
	const LumpData data{ 0x01u, 0x02u, 0x03u, 0x00u, 0x00u, 0x00u, 0xFFu, 0x02u };
	LoadStream stream( data );

	uint16_t u16;
	int32_t i32;
	int8_t i8;
	bool b;
	stream.ReadUInt16( u16 );
	stream.ReadInt32( i32 );
	stream.ReadInt8( i8 );
	stream.ReadBool( b );

	EXPECT_EQ( u16, 0x0201u );
	EXPECT_EQ( i32, 3 );
	EXPECT_EQ( i8, -1 );
	EXPECT_TRUE( b );
	EXPECT_TRUE( stream.AtEnd() );
}

TEST( LoadStreamTest, ReadPastEndThrows )
{
	const LumpData data{ 1u, 2u, 3u };
	LoadStream stream( data );

	int32_t value;
	EXPECT_THROW( stream.ReadInt32( value ), DecodeError );
	EXPECT_EQ( stream.GetBufferPos(), 0u );

	int16_t value16;
	stream.ReadInt16( value16 );
	EXPECT_EQ( stream.GetRemaining(), 1u );
	EXPECT_THROW( stream.ReadInt16( value16 ), DecodeError );
}

TEST( LoadStreamTest, SeekAndSkipAreBounded )
{
	const LumpData data( 10u, 0u );
	LoadStream stream( data );

	stream.SetBufferPos( 10u );
	EXPECT_TRUE( stream.AtEnd() );
	EXPECT_THROW( stream.SetBufferPos( 11u ), DecodeError );

	stream.SetBufferPos( 4u );
	stream.Skip( 6u );
	EXPECT_TRUE( stream.AtEnd() );

	stream.SetBufferPos( 4u );
	EXPECT_THROW( stream.Skip( 7u ), DecodeError );

	EXPECT_THROW( LoadStream out_of_range_stream( data, 11u ), DecodeError );
}

TEST( LoadStreamTest, FixedStringIsTrimmedAtNull )
{
	const LumpData data{ 'A', 'b', 0u, 0u, 'c', 'X' };
	LoadStream stream( data );

	std::string str;
	stream.ReadFixedString( 5u, str );
	EXPECT_EQ( str, "Ab" );
	EXPECT_EQ( stream.GetBufferPos(), 5u );

	stream.ReadFixedString( 1u, str );
	EXPECT_EQ( str, "X" );
}

TEST( LoadStreamTest, SizedStringAndBytes )
{
	LumpData data;
	SaveStream save_stream( data );
	save_stream.WriteSizedString( "Aria" );
	save_stream.WriteSizedBytes( LumpData{ 9u, 8u } );

	LoadStream stream( data );
	std::string str;
	LumpData bytes;
	stream.ReadSizedString( str );
	stream.ReadSizedBytes( bytes );

	EXPECT_EQ( str, "Aria" );
	EXPECT_EQ( bytes, ( LumpData{ 9u, 8u } ) );
	EXPECT_TRUE( stream.AtEnd() );
}

TEST( LoadStreamTest, ReadCountRejectsInvalidCounts )
{
	LumpData data;
	SaveStream save_stream( data );
	save_stream.WriteInt32( int32_t(-1) );
	save_stream.WriteInt32( int32_t(3) );
	save_stream.WriteZeros( 8u );

	LoadStream stream( data );
	EXPECT_THROW( stream.ReadCount( 1u ), DecodeError );

	// 3 elements of 4 bytes do not fit into 8 bytes.
	stream.SetBufferPos( 4u );
	EXPECT_THROW( stream.ReadCount( 4u ), DecodeError );

	stream.SetBufferPos( 4u );
	EXPECT_EQ( stream.ReadCount( 2u ), 3u );
}

TEST( LoadStreamTest, SubStreamIsLimited )
{
	const LumpData data{ 1u, 0u, 0u, 0u, 2u, 0u, 0u, 0u };
	LoadStream stream( data );

	LoadStream sub_stream= stream.SubStream( 4u );
	EXPECT_EQ( stream.GetBufferPos(), 4u );
	EXPECT_EQ( sub_stream.GetSize(), 4u );

	int32_t value;
	sub_stream.ReadInt32( value );
	EXPECT_EQ( value, 1 );
	EXPECT_THROW( sub_stream.ReadInt32( value ), DecodeError );

	EXPECT_THROW( stream.SubStream( 5u ), DecodeError );
}

TEST( SaveStreamTest, WritesLittleEndianValues )
{
	LumpData data;
	SaveStream stream( data );
	stream.WriteInt16( int16_t(-2) );
	stream.WriteUInt32( uint32_t(0x04030201u) );
	stream.WriteBool( true );

	EXPECT_EQ( data, ( LumpData{ 0xFEu, 0xFFu, 0x01u, 0x02u, 0x03u, 0x04u, 0x01u } ) );
	EXPECT_EQ( stream.GetBufferPos(), 7u );
}

TEST( SaveStreamTest, FixedStringIsPaddedOrCut )
{
	LumpData data;
	SaveStream stream( data );
	stream.WriteFixedString( "ab", 4u );
	stream.WriteFixedString( "abcdef", 4u );

	EXPECT_EQ( data, ( LumpData{ 'a', 'b', 0u, 0u, 'a', 'b', 'c', 'd' } ) );
}

TEST( SaveStreamTest, BlockSizeIsPatched )
{
	LumpData data;
	SaveStream stream( data );
	const unsigned int block= stream.BeginBlock( "TAG " );
	stream.WriteInt32( int32_t(42) );
	stream.WriteUInt8( uint8_t(1) );
	stream.EndBlock( block );

	ASSERT_EQ( data.size(), 13u );

	LoadStream load_stream( data );
	std::string tag;
	int32_t size;
	load_stream.ReadFixedString( 4u, tag );
	load_stream.ReadInt32( size );
	EXPECT_EQ( tag, "TAG " );
	EXPECT_EQ( size, 5 );
}

} // namespace Tests

} // namespace RpgArchive
