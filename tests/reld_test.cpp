#include <gtest/gtest.h>

#include "../RpgArchive/record_decoders.hpp"
#include "../RpgArchive/reld.hpp"
#include "../RpgArchive/save_stream.hpp"
#include "test_utils.hpp"

namespace RpgArchive
{

namespace Tests
{

TEST( ReldTest, IsReldChunk )
{
	EXPECT_FALSE( IsReldChunk( LumpData() ) );
	EXPECT_FALSE( IsReldChunk( MakeBytes( "RELD" ) ) );
	EXPECT_TRUE( IsReldChunk( MakeBytes( "RELD1234" ) ) );
	EXPECT_FALSE( IsReldChunk( MakeBytes( "RELX1234" ) ) );
	EXPECT_FALSE( IsReldChunk( MakeBytes( "reld1234" ) ) );
}

TEST( ReldTest, TagNames )
{
	EXPECT_EQ( ReldTagFromName( "TITL" ), ReldTag::Title );
	EXPECT_EQ( ReldTagFromName( "MAP " ), ReldTag::Map );
	EXPECT_EQ( ReldTagFromName( "STX " ), ReldTag::StartX );
	EXPECT_EQ( ReldTagFromName( "MAP" ), ReldTag::Unknown );
	EXPECT_EQ( ReldTagFromName( "hero" ), ReldTag::Unknown );

	EXPECT_STREQ( ReldTagName( ReldTag::Enemy ), "ENEM" );
	EXPECT_STREQ( ReldTagName( ReldTag::Unknown ), "" );
}

TEST( ReldTest, VersionOnlyChunkHasNoBlocks )
{
	LumpData data;
	SaveStream stream( data );
	BeginReldChunk( stream, 42 );

	unsigned int blocks= 0u;
	EXPECT_EQ( ReadReldBlocks( data, [&]( ReldBlock& ) { blocks++; return true; } ), 42 );
	EXPECT_EQ( blocks, 0u );
}

TEST( ReldTest, UnknownBlockIsSkipped )
{
	LumpData data;
	SaveStream stream( data );
	BeginReldChunk( stream, 7 );

	unsigned int block= stream.BeginBlock( "TITL" );
	stream.WriteBytes( "Test", 4u );
	stream.EndBlock( block );

	block= stream.BeginBlock( "ZZZZ" );
	stream.WriteBytes( "\x01\x02\x03\x04\x05", 5u );
	stream.EndBlock( block );

	block= stream.BeginBlock( "AUTH" );
	stream.WriteBytes( "Me", 2u );
	stream.EndBlock( block );

	std::vector<ReldTag> handled_tags;
	const int32_t version=
		ReadReldBlocks(
			data,
			[&]( ReldBlock& reld_block ) -> bool
			{
				EXPECT_NE( reld_block.tag, ReldTag::Unknown );
				handled_tags.push_back( reld_block.tag );
				return true;
			} );

	EXPECT_EQ( version, 7 );
	EXPECT_EQ( handled_tags, ( std::vector<ReldTag>{ ReldTag::Title, ReldTag::Author } ) );

	GeneralData general;
	DecodeGeneralData( data, general );
	EXPECT_EQ( general.title, "Test" );
	EXPECT_EQ( general.author, "Me" );
	EXPECT_EQ( general.version, 7 );
}

TEST( ReldTest, ReadingContinuesAfterBlockEnd )
{
	LumpData data;
	SaveStream stream( data );
	BeginReldChunk( stream );

	// Extended block, only first value is known.
	unsigned int block= stream.BeginBlock( "STMP" );
	stream.WriteInt32( int32_t(5) );
	stream.WriteInt32( int32_t(99) );
	stream.EndBlock( block );

	block= stream.BeginBlock( "STX " );
	stream.WriteInt32( int32_t(3) );
	stream.EndBlock( block );

	GeneralData general;
	DecodeGeneralData( data, general );
	EXPECT_EQ( general.starting_map, 5 );
	EXPECT_EQ( general.starting_x, 3 );
}

TEST( ReldTest, PayloadIsLimitedByBlockSize )
{
	LumpData data;
	SaveStream stream( data );
	BeginReldChunk( stream );

	unsigned int block= stream.BeginBlock( "STMP" );
	stream.WriteUInt16( uint16_t(5) );
	stream.EndBlock( block );

	block= stream.BeginBlock( "STX " );
	stream.WriteInt32( int32_t(3) );
	stream.EndBlock( block );

	GeneralData general;
	EXPECT_THROW( DecodeGeneralData( data, general ), DecodeError );
}

TEST( ReldTest, BrokenBlockHeadersThrow )
{
	{ // Negative block size.
		LumpData data;
		SaveStream stream( data );
		BeginReldChunk( stream );
		stream.WriteFixedString( "TITL", 4u );
		stream.WriteInt32( int32_t(-1) );

		EXPECT_THROW( ReadReldBlocks( data, []( ReldBlock& ) { return true; } ), DecodeError );
	}
	{ // Block runs past chunk end.
		LumpData data;
		SaveStream stream( data );
		BeginReldChunk( stream );
		stream.WriteFixedString( "TITL", 4u );
		stream.WriteInt32( int32_t(100) );
		stream.WriteBytes( "abc", 3u );

		EXPECT_THROW( ReadReldBlocks( data, []( ReldBlock& ) { return true; } ), DecodeError );
	}
	{ // Truncated block header.
		LumpData data;
		SaveStream stream( data );
		BeginReldChunk( stream );
		stream.WriteBytes( "TI", 2u );

		EXPECT_THROW( ReadReldBlocks( data, []( ReldBlock& ) { return true; } ), DecodeError );
	}
}

} // namespace Tests

} // namespace RpgArchive
