#include <gtest/gtest.h>

#include "../RpgArchive/load_stream.hpp"
#include "../RpgArchive/record_decoders.hpp"
#include "../RpgArchive/save_stream.hpp"
#include "test_utils.hpp"

namespace RpgArchive
{

namespace Tests
{

namespace
{

void WriteStats( SaveStream& stream, const int32_t hp )
{
	stream.WriteInt32( hp );
	stream.WriteZeros( 7u * sizeof(int32_t) );
}

void WritePlayer( SaveStream& stream )
{
	stream.WriteFixedString( "Hero", 32u );
	stream.WriteInt32( int32_t(5) ); // Level.
	stream.WriteInt32( int32_t(100) ); // Experience.
	stream.WriteInt32( int32_t(30) ); // Gold.
	WriteStats( stream, 45 );
	stream.WriteInt32( int32_t(3) ); // X.
	stream.WriteInt32( int32_t(4) ); // Y.
	stream.WriteInt32( int32_t(2) ); // Map.
	stream.WriteInt32( int32_t(1) ); // Direction.
}

void ExpectPlayer( const SaveData::Player& player )
{
	EXPECT_EQ( player.name, "Hero" );
	EXPECT_EQ( player.level, 5 );
	EXPECT_EQ( player.experience, 100 );
	EXPECT_EQ( player.gold, 30 );
	EXPECT_EQ( player.stats.hp, 45 );
	EXPECT_EQ( player.x, 3 );
	EXPECT_EQ( player.y, 4 );
	EXPECT_EQ( player.map_id, 2 );
	EXPECT_EQ( player.direction, 1 );
}

} // namespace

TEST( ScriptDecoderTest, ModernScript )
{
	LumpData data;
	SaveStream stream( data );
	BeginReldChunk( stream );

	const unsigned int block= stream.BeginBlock( "SCRP" );
	stream.WriteInt32( int32_t(4) );
	stream.WriteFixedString( "intro", 32u );
	stream.WriteInt32( int32_t(1) );
	stream.WriteSizedBytes( LumpData{ 1u, 2u, 3u } );

	stream.WriteInt32( int32_t(4) ); // Constants.
	stream.WriteInt32( int32_t(0) );
	stream.WriteSizedString( "hi" );
	stream.WriteInt32( int32_t(1) );
	stream.WriteInt32( int32_t(42) );
	stream.WriteInt32( int32_t(2) );
	stream.WriteFloat( 1.5f );
	stream.WriteInt32( int32_t(9) ); // Unknown kind, has no payload.

	stream.WriteInt32( int32_t(2) ); // Labels.
	stream.WriteFixedString( "start", 32u );
	stream.WriteInt32( int32_t(0) );
	stream.WriteFixedString( "loop", 32u );
	stream.WriteInt32( int32_t(16) );
	stream.EndBlock( block );

	std::vector<ScriptData> scripts;
	DecodeScriptData( data, scripts );

	ASSERT_EQ( scripts.size(), 1u );
	const ScriptData& script= scripts[0];
	EXPECT_EQ( script.id, 4 );
	EXPECT_EQ( script.name, "intro" );
	EXPECT_EQ( script.script_type, 1 );
	EXPECT_EQ( script.bytecode, ( LumpData{ 1u, 2u, 3u } ) );

	ASSERT_EQ( script.constants.size(), 4u );
	EXPECT_TRUE( script.constants[0].kind == ScriptData::Constant::Kind::String );
	EXPECT_EQ( script.constants[0].string_value, "hi" );
	EXPECT_TRUE( script.constants[1].kind == ScriptData::Constant::Kind::Int );
	EXPECT_EQ( script.constants[1].int_value, 42 );
	EXPECT_TRUE( script.constants[2].kind == ScriptData::Constant::Kind::Float );
	EXPECT_EQ( script.constants[2].float_value, 1.5f );
	EXPECT_TRUE( script.constants[3].kind == ScriptData::Constant::Kind::None );

	EXPECT_EQ( script.labels, ( std::map<std::string, int>{ { "start", 0 }, { "loop", 16 } } ) );
}

TEST( ScriptDecoderTest, LegacyScripts )
{
	LumpData data;
	SaveStream stream( data );
	stream.WriteZeros( c_legacy_script_size );

	stream.WriteInt32( int32_t(8) );
	stream.WriteFixedString( "battle", 32u );
	stream.WriteInt32( int32_t(2) );
	stream.WriteZeros( c_legacy_script_size - 40u );

	std::vector<ScriptData> scripts;
	DecodeScriptData( data, scripts );

	ASSERT_EQ( scripts.size(), 1u );
	EXPECT_EQ( scripts[0].id, 8 );
	EXPECT_EQ( scripts[0].name, "battle" );
	EXPECT_EQ( scripts[0].script_type, 2 );
	EXPECT_TRUE( scripts[0].bytecode.empty() );
	EXPECT_TRUE( scripts[0].constants.empty() );
	EXPECT_TRUE( scripts[0].labels.empty() );
}

TEST( TextureDecoderTest, ModernTextures )
{
	LumpData data;
	SaveStream stream( data );
	BeginReldChunk( stream );

	unsigned int block= stream.BeginBlock( "TEXT" );
	stream.WriteInt32( int32_t(1) );
	stream.WriteFixedString( "grass", 32u );
	stream.WriteInt32( int32_t(2) );
	stream.WriteInt32( int32_t(1) );
	stream.WriteInt32( int32_t(TextureData::c_format_indexed) );
	stream.WriteInt32( int32_t(0) );
	stream.WriteSizedBytes( LumpData{ 0u, 1u } );
	stream.WriteSizedBytes( LumpData{ 10u, 20u, 30u } ); // Palette.
	stream.WriteInt32( int32_t(0) ); // Metadata.
	stream.EndBlock( block );

	block= stream.BeginBlock( "TEXT" );
	stream.WriteInt32( int32_t(2) );
	stream.WriteFixedString( "sky", 32u );
	stream.WriteInt32( int32_t(1) );
	stream.WriteInt32( int32_t(1) );
	stream.WriteInt32( int32_t(1) ); // Not indexed, no palette.
	stream.WriteInt32( int32_t(0) );
	stream.WriteSizedBytes( LumpData{ 1u, 2u, 3u, 4u } );
	stream.WriteInt32( int32_t(1) ); // Metadata.
	stream.WriteSizedString( "author" );
	stream.WriteSizedString( "me" );
	stream.EndBlock( block );

	std::vector<TextureData> textures;
	DecodeTextureData( data, textures );

	ASSERT_EQ( textures.size(), 2u );
	EXPECT_EQ( textures[0].name, "grass" );
	EXPECT_EQ( textures[0].width, 2 );
	EXPECT_EQ( textures[0].pixel_data, ( LumpData{ 0u, 1u } ) );
	EXPECT_EQ( textures[0].palette_data, ( LumpData{ 10u, 20u, 30u } ) );
	EXPECT_TRUE( textures[0].metadata.empty() );

	EXPECT_EQ( textures[1].id, 2 );
	EXPECT_EQ( textures[1].name, "sky" );
	EXPECT_EQ( textures[1].pixel_data, ( LumpData{ 1u, 2u, 3u, 4u } ) );
	EXPECT_TRUE( textures[1].palette_data.empty() );
	ASSERT_EQ( textures[1].metadata.size(), 1u );
	EXPECT_EQ( textures[1].metadata.at( "author" ), "me" );
}

TEST( TextureDecoderTest, LegacyTextures )
{
	LumpData data;
	SaveStream stream( data );
	stream.WriteInt32( int32_t(3) );
	stream.WriteFixedString( "wall", 32u );
	stream.WriteInt16( int16_t(64) );
	stream.WriteInt16( int16_t(32) );
	stream.WriteInt16( int16_t(3) );
	stream.WriteInt16( int16_t(2) );
	stream.WriteZeros( 4u );
	ASSERT_EQ( data.size(), c_legacy_texture_size );

	std::vector<TextureData> textures;
	DecodeTextureData( data, textures );

	ASSERT_EQ( textures.size(), 1u );
	EXPECT_EQ( textures[0].id, 3 );
	EXPECT_EQ( textures[0].name, "wall" );
	EXPECT_EQ( textures[0].width, 64 );
	EXPECT_EQ( textures[0].height, 32 );
	EXPECT_EQ( textures[0].format, 3 );
	EXPECT_EQ( textures[0].palette, 2 );
	EXPECT_TRUE( textures[0].pixel_data.empty() );
}

TEST( AudioDecoderTest, ModernAndLegacyAudio )
{
	LumpData modern_data;
	SaveStream modern_stream( modern_data );
	BeginReldChunk( modern_stream );
	const unsigned int block= modern_stream.BeginBlock( "AUDI" );
	modern_stream.WriteInt32( int32_t(6) );
	modern_stream.WriteFixedString( "theme", 32u );
	modern_stream.WriteInt32( int32_t(1) ); // Type.
	modern_stream.WriteInt32( int32_t(2) ); // Format.
	modern_stream.WriteInt32( int32_t(22050) );
	modern_stream.WriteInt32( int32_t(2) );
	modern_stream.WriteInt32( int32_t(16) );
	modern_stream.WriteSizedBytes( LumpData{ 5u, 6u } );
	modern_stream.WriteInt32( int32_t(0) );
	modern_stream.EndBlock( block );

	std::vector<AudioData> audio;
	DecodeAudioData( modern_data, audio );
	ASSERT_EQ( audio.size(), 1u );
	EXPECT_EQ( audio[0].id, 6 );
	EXPECT_EQ( audio[0].name, "theme" );
	EXPECT_EQ( audio[0].sample_rate, 22050 );
	EXPECT_EQ( audio[0].bit_depth, 16 );
	EXPECT_EQ( audio[0].data, ( LumpData{ 5u, 6u } ) );

	// Legacy record is same header without data.
	const LumpData legacy_data( modern_data.begin() + 16, modern_data.begin() + 16 + c_legacy_audio_size );
	DecodeAudioData( legacy_data, audio );
	ASSERT_EQ( audio.size(), 1u );
	EXPECT_EQ( audio[0].name, "theme" );
	EXPECT_EQ( audio[0].channels, 2 );
	EXPECT_TRUE( audio[0].data.empty() );
}

TEST( SaveDecoderTest, ModernSave )
{
	LumpData data;
	SaveStream stream( data );
	BeginReldChunk( stream );

	const unsigned int block= stream.BeginBlock( "SAVE" );
	stream.WriteInt32( int32_t(1) );
	stream.WriteFixedString( "Slot 1", 32u );
	stream.WriteInt64( int64_t(1700000000000) );
	stream.WriteInt32( int32_t(2) );
	WritePlayer( stream );

	stream.WriteInt32( int32_t(1) ); // Inventory.
	stream.WriteInt32( int32_t(10) );
	stream.WriteInt32( int32_t(2) );
	stream.WriteBool( true );

	stream.WriteInt32( int32_t(1) ); // Party.
	stream.WriteFixedString( "Mage", 32u );
	stream.WriteInt32( int32_t(3) );
	stream.WriteInt32( int32_t(40) );
	WriteStats( stream, 25 );

	stream.WriteInt32( int32_t(2) ); // Flags.
	stream.WriteFixedString( "door_open", 32u );
	stream.WriteBool( true );
	stream.WriteFixedString( "boss_defeated", 32u );
	stream.WriteBool( false );
	stream.EndBlock( block );

	std::vector<SaveData> saves;
	DecodeSaveData( data, saves );

	ASSERT_EQ( saves.size(), 1u );
	const SaveData& save= saves[0];
	EXPECT_EQ( save.id, 1 );
	EXPECT_EQ( save.name, "Slot 1" );
	EXPECT_EQ( save.timestamp, int64_t(1700000000000) );
	EXPECT_EQ( save.game_version, 2 );
	ExpectPlayer( save.player );

	ASSERT_EQ( save.player.inventory.size(), 1u );
	EXPECT_EQ( save.player.inventory[0].item_id, 10 );
	EXPECT_EQ( save.player.inventory[0].quantity, 2 );
	EXPECT_TRUE( save.player.inventory[0].equipped );

	ASSERT_EQ( save.player.party.size(), 1u );
	EXPECT_EQ( save.player.party[0].name, "Mage" );
	EXPECT_EQ( save.player.party[0].experience, 40 );
	EXPECT_EQ( save.player.party[0].stats.hp, 25 );

	EXPECT_EQ( save.flags, ( std::map<std::string, bool>{ { "door_open", true }, { "boss_defeated", false } } ) );
}

TEST( SaveDecoderTest, LegacySaves )
{
	LumpData data;
	SaveStream stream( data );
	stream.WriteInt32( int32_t(3) );
	stream.WriteFixedString( "Quick save", 32u );
	stream.WriteInt32( int32_t(1) );
	WritePlayer( stream );
	stream.WriteZeros( c_legacy_save_size - stream.GetBufferPos() );

	// Unused slot.
	stream.WriteZeros( c_legacy_save_size );

	std::vector<SaveData> saves;
	DecodeSaveData( data, saves );

	ASSERT_EQ( saves.size(), 1u );
	EXPECT_EQ( saves[0].id, 3 );
	EXPECT_EQ( saves[0].name, "Quick save" );
	EXPECT_EQ( saves[0].game_version, 1 );
	EXPECT_EQ( saves[0].timestamp, 0 );
	ExpectPlayer( saves[0].player );
	EXPECT_TRUE( saves[0].player.inventory.empty() );
	EXPECT_TRUE( saves[0].player.party.empty() );
	EXPECT_TRUE( saves[0].flags.empty() );
}

} // namespace Tests

} // namespace RpgArchive
