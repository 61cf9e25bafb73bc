#include <cstring>

#include "decoder_common.hpp"

#include "record_decoders.hpp"

namespace RpgArchive
{

namespace
{

constexpr char g_tileset_magic[4]= { 'R', 'G', 'F', 'X' };

constexpr int g_max_tiles= 65536;
constexpr int g_max_animations= 1000;
constexpr int g_max_animation_frames= 100;
constexpr int g_max_metadata_entries= 1000;
constexpr int g_max_metadata_key_length= 1000;
constexpr int g_max_metadata_value_length= 10000;

// Reads sized bytes block, if it is valid. Otherwise leaves result empty.
bool ReadOptionalBlock( LoadStream& stream, std::vector<unsigned char>& out_bytes )
{
	out_bytes.clear();
	if( stream.GetRemaining() < sizeof(int32_t) )
		return false;

	const int size= ReadInt32Value( stream );
	if( size < 0 || static_cast<unsigned int>(size) > stream.GetRemaining() )
		return false;

	stream.ReadBytes( static_cast<unsigned int>(size), out_bytes );
	return true;
}

void ReadAnimations( LoadStream& stream, TilesetData& tileset )
{
	const int count= ReadInt32Value( stream );
	if( count <= 0 || count >= g_max_animations )
	{
		Log::Warning( "Invalid tileset animations count: ", count );
		return;
	}

	tileset.animations.resize( static_cast<size_t>(count) );
	for( int i= 0; i < count; i++ )
	{
		TilesetData::Animation& animation= tileset.animations[ static_cast<size_t>(i) ];
		if( stream.GetRemaining() < 3u * sizeof(int32_t) )
		{
			Log::Warning( "Unexpected end of tileset at animation ", i );
			continue;
		}

		animation.tile_id= ReadInt32Value( stream );
		const int frame_count= ReadInt32Value( stream );
		animation.frame_delay= ReadInt32Value( stream );

		if( frame_count <= 0 || frame_count >= g_max_animation_frames ||
			static_cast<unsigned int>(frame_count) * sizeof(int32_t) > stream.GetRemaining() )
		{
			Log::Warning( "Invalid frame count ", frame_count, " of tileset animation ", i );
			animation= TilesetData::Animation();
			continue;
		}

		animation.frames.resize( static_cast<size_t>(frame_count) );
		for( int& frame : animation.frames )
			frame= ReadInt32Value( stream );
	}
}

void ReadTilesetMetadata( LoadStream& stream, TilesetData& tileset )
{
	const int count= ReadInt32Value( stream );
	if( count <= 0 || count >= g_max_metadata_entries )
		return;

	for( int i= 0; i < count; i++ )
	{
		if( stream.GetRemaining() < 2u * sizeof(int32_t) )
		{
			Log::Warning( "Unexpected end of tileset at metadata entry ", i );
			return;
		}

		const int key_length= ReadInt32Value( stream );
		const int value_length= ReadInt32Value( stream );
		if( key_length <= 0 || key_length >= g_max_metadata_key_length ||
			value_length < 0 || value_length >= g_max_metadata_value_length ||
			static_cast<unsigned int>( key_length + value_length ) > stream.GetRemaining() )
		{
			Log::Warning( "Invalid tileset metadata entry ", i, ", key length: ", key_length, ", value length: ", value_length );
			return;
		}

		std::string key, value;
		stream.ReadFixedString( static_cast<unsigned int>(key_length), key );
		stream.ReadFixedString( static_cast<unsigned int>(value_length), value );
		tileset.metadata[ std::move(key) ]= std::move(value);
	}
}

} // namespace

bool DecodeTilesetData( const LumpData& data, TilesetData& out_tileset )
{
	out_tileset= TilesetData();

	if( data.size() < sizeof(g_tileset_magic) || std::memcmp( data.data(), g_tileset_magic, sizeof(g_tileset_magic) ) != 0 )
	{
		Log::Warning( "Invalid tileset format" );
		return false;
	}

	LoadStream stream( data, sizeof(g_tileset_magic) );

	out_tileset.version= ReadInt32Value( stream );
	const int tile_count= ReadInt32Value( stream );
	out_tileset.tile_size= ReadInt32Value( stream );
	stream.ReadBool( out_tileset.has_animations );

	if( tile_count < 0 || tile_count > g_max_tiles )
		throw DecodeError( "Invalid tiles count: " + std::to_string(tile_count) );

	out_tileset.tiles.resize( static_cast<size_t>(tile_count) );
	for( int i= 0; i < tile_count; i++ )
	{
		std::vector<unsigned char>& tile= out_tileset.tiles[ static_cast<size_t>(i) ];
		if( !ReadOptionalBlock( stream, tile ) || tile.empty() )
			Log::Warning( "Invalid data of tile ", i );
	}

	if( !stream.AtEnd() && !ReadOptionalBlock( stream, out_tileset.palette ) )
		Log::Warning( "Invalid tileset palette" );

	if( out_tileset.has_animations && stream.GetRemaining() >= sizeof(int32_t) )
		ReadAnimations( stream, out_tileset );

	if( stream.GetRemaining() >= sizeof(int32_t) )
		ReadTilesetMetadata( stream, out_tileset );

	Log::Info(
		"Tileset: ", out_tileset.tiles.size(), " tiles ", out_tileset.tile_size, "x", out_tileset.tile_size,
		", animations: ", out_tileset.animations.size(), ", metadata: ", out_tileset.metadata.size() );
	return true;
}

} // namespace RpgArchive
