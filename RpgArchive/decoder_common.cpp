#include "decoder_common.hpp"

namespace RpgArchive
{

int ReadInt16Value( LoadStream& stream )
{
	int16_t value;
	stream.ReadInt16( value );
	return value;
}

int ReadInt32Value( LoadStream& stream )
{
	int32_t value;
	stream.ReadInt32( value );
	return value;
}

void ReadStats16( LoadStream& stream, Stats& out_stats )
{
	out_stats.hp= ReadInt16Value( stream );
	out_stats.mp= ReadInt16Value( stream );
	out_stats.attack= ReadInt16Value( stream );
	out_stats.defense= ReadInt16Value( stream );
	out_stats.speed= ReadInt16Value( stream );
	out_stats.magic= ReadInt16Value( stream );
	out_stats.magic_defense= ReadInt16Value( stream );
	out_stats.luck= ReadInt16Value( stream );
}

void ReadStats32( LoadStream& stream, Stats& out_stats )
{
	out_stats.hp= ReadInt32Value( stream );
	out_stats.mp= ReadInt32Value( stream );
	out_stats.attack= ReadInt32Value( stream );
	out_stats.defense= ReadInt32Value( stream );
	out_stats.speed= ReadInt32Value( stream );
	out_stats.magic= ReadInt32Value( stream );
	out_stats.magic_defense= ReadInt32Value( stream );
	out_stats.luck= ReadInt32Value( stream );
}

void ReadSizedInt32Array( LoadStream& stream, std::vector<int>& out_array )
{
	const unsigned int count= stream.ReadCount( sizeof(int32_t) );

	out_array.resize( count );
	for( int& value : out_array )
		value= ReadInt32Value( stream );
}

void ReadSizedFloatArray( LoadStream& stream, std::vector<float>& out_array )
{
	const unsigned int count= stream.ReadCount( sizeof(float) );
	ReadFloatArray( stream, count, out_array );
}

void ReadFloatArray( LoadStream& stream, const unsigned int count, std::vector<float>& out_array )
{
	out_array.resize( count );
	for( float& value : out_array )
		stream.ReadFloat( value );
}

void ReadMetadata( LoadStream& stream, std::map<std::string, std::string>& out_metadata )
{
	// Each entry has at least two length fields.
	const unsigned int count= stream.ReadCount( 2u * sizeof(int32_t) );

	for( unsigned int i= 0u; i < count; i++ )
	{
		std::string key, value;
		stream.ReadSizedString( key );
		stream.ReadSizedString( value );
		out_metadata[ std::move(key) ]= std::move(value);
	}
}

} // namespace RpgArchive
