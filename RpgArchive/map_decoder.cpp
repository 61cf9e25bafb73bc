#include "decoder_common.hpp"
#include "reld.hpp"

#include "record_decoders.hpp"

namespace RpgArchive
{

namespace
{

// Possible sizes of legacy map headers, in order of checking.
const unsigned int g_legacy_map_header_sizes[]= { 32u, 24u, 16u, 8u };
constexpr unsigned int g_legacy_max_maps= 1000u;
constexpr unsigned int g_legacy_maps_to_check= 3u;

void DecodeReldMap( LoadStream& stream, MapData& map )
{
	map.width= ReadInt32Value( stream );
	map.height= ReadInt32Value( stream );
	const int layers_count= ReadInt32Value( stream );
	map.background= ReadInt32Value( stream );
	map.music= ReadInt32Value( stream );
	map.tileset_id= ReadInt32Value( stream );

	if( map.width <= 0 || map.height <= 0 || layers_count < 1 || layers_count > MapData::c_max_layers )
		throw DecodeError(
			"Invalid map size " + std::to_string(map.width) + "x" + std::to_string(map.height) +
			", layers: " + std::to_string(layers_count) );

	// Each cell takes 4 bytes in each layer and 1 byte in passability.
	const uint64_t cells= uint64_t(map.width) * uint64_t(map.height);
	if( cells * ( uint64_t(layers_count) * sizeof(int32_t) + 1u ) > stream.GetRemaining() )
		throw DecodeError( "Map cells data does not fit into block" );

	// Data stored in columns.
	map.layers.resize( static_cast<size_t>(layers_count) );
	for( std::vector<int32_t>& layer : map.layers )
	{
		layer.resize( static_cast<size_t>(cells) );
		for( int x= 0; x < map.width; x++ )
		for( int y= 0; y < map.height; y++ )
			stream.ReadInt32( layer[ x + y * map.width ] );
	}

	map.passability.resize( static_cast<size_t>(cells) );
	for( int x= 0; x < map.width; x++ )
	for( int y= 0; y < map.height; y++ )
	{
		bool passable;
		stream.ReadBool( passable );
		map.passability[ x + y * map.width ]= passable ? 1u : 0u;
	}

	const unsigned int npc_count= stream.ReadCount( 7u * sizeof(int32_t) );
	map.npcs.resize( npc_count );
	for( MapData::Npc& npc : map.npcs )
	{
		npc.x= ReadInt32Value( stream );
		npc.y= ReadInt32Value( stream );
		npc.picture= ReadInt32Value( stream );
		npc.palette= ReadInt32Value( stream );
		npc.movement_type= ReadInt32Value( stream );
		npc.movement_speed= ReadInt32Value( stream );
		npc.script= ReadInt32Value( stream );
	}

	const unsigned int event_count= stream.ReadCount( 5u * sizeof(int32_t) );
	map.events.resize( event_count );
	for( MapData::Event& event : map.events )
	{
		event.id= ReadInt32Value( stream );
		event.x= ReadInt32Value( stream );
		event.y= ReadInt32Value( stream );
		event.trigger= ReadInt32Value( stream );
		event.script= ReadInt32Value( stream );
	}
}

bool IsValidLegacyMapSize( const int width, const int height )
{
	return
		width >= MapData::c_min_width && width <= MapData::c_max_size &&
		height >= MapData::c_min_height && height <= MapData::c_max_size;
}

// Returns 0, if header size can not be detected.
unsigned int DetectLegacyMapHeaderSize( const LumpData& data )
{
	for( const unsigned int header_size : g_legacy_map_header_sizes )
	{
		if( data.size() < header_size || data.size() % header_size != 0u )
			continue;

		const unsigned int map_count= static_cast<unsigned int>( data.size() / header_size );
		if( map_count > g_legacy_max_maps )
			continue;

		bool valid= true;
		for( unsigned int i= 0u; i < map_count && i < g_legacy_maps_to_check; i++ )
		{
			LoadStream stream( data.data() + i * header_size, header_size );
			const int width= ReadInt16Value( stream );
			const int height= ReadInt16Value( stream );
			if( !IsValidLegacyMapSize( width, height ) )
			{
				valid= false;
				break;
			}
		}

		if( valid )
			return header_size;
	}

	return 0u;
}

void ClampLegacyMapSize( MapData& map, int& layers_count )
{
	const int original_width= map.width;
	const int original_height= map.height;

	if( map.width <= 0 || map.width > MapData::c_max_size )
		map.width= MapData::c_default_size;
	if( map.height <= 0 || map.height > MapData::c_max_size )
		map.height= MapData::c_default_size;
	if( map.width < MapData::c_min_width )
		map.width= MapData::c_min_width;
	if( map.height < MapData::c_min_height )
		map.height= MapData::c_min_height;

	if( map.width != original_width || map.height != original_height )
		Log::Warning( "Map size changed from ", original_width, "x", original_height, " to ", map.width, "x", map.height );

	if( layers_count <= 0 || layers_count > MapData::c_max_layers )
		layers_count= MapData::c_default_layers;
}

// Legacy map lumps contain only headers.
// Tiles are zero, all cells are passable, no npcs and events.
void DecodeLegacyMap( LoadStream& stream, MapData& map )
{
	const unsigned int header_size= stream.GetSize();

	map.width= ReadInt16Value( stream );
	map.height= ReadInt16Value( stream );

	int layers_count= MapData::c_default_layers;
	if( header_size >= 6u )
		layers_count= ReadInt16Value( stream );
	if( header_size >= 8u )
		map.background= ReadInt16Value( stream );
	if( header_size >= 10u )
		map.music= ReadInt16Value( stream );
	if( header_size >= 12u )
		map.tileset_id= ReadInt16Value( stream );

	ClampLegacyMapSize( map, layers_count );

	const size_t cells= size_t(map.width) * size_t(map.height);
	map.layers.assign( static_cast<size_t>(layers_count), std::vector<int32_t>( cells, 0 ) );
	map.passability.assign( cells, 1u );
}

void DecodeLegacyMapData( const LumpData& data, std::vector<MapData>& out_maps )
{
	const unsigned int header_size= DetectLegacyMapHeaderSize( data );
	if( header_size == 0u )
	{
		Log::Warning( "Can not detect legacy map header size, data size: ", data.size() );
		return;
	}

	const unsigned int map_count= static_cast<unsigned int>( data.size() / header_size );
	Log::Info( "Legacy maps: ", map_count, " maps with header size ", header_size );

	out_maps.resize( map_count );
	for( unsigned int i= 0u; i < map_count; i++ )
	{
		LoadStream stream( data.data() + i * header_size, header_size );
		DecodeLegacyMap( stream, out_maps[i] );
	}
}

} // namespace

void DecodeMapData( const LumpData& data, std::vector<MapData>& out_maps )
{
	out_maps.clear();

	if( IsReldChunk( data ) )
		DecodeReldRecords( data, ReldTag::Map, out_maps, DecodeReldMap );
	else
		DecodeLegacyMapData( data, out_maps );
}

} // namespace RpgArchive
