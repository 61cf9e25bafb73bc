#pragma once
#include <map>
#include <string>
#include <vector>

#include "game_data.hpp"
#include "load_stream.hpp"
#include "log.hpp"
#include "reld.hpp"

// Helpers, shared between record decoders.

namespace RpgArchive
{

constexpr unsigned int c_fixed_name_size= 32u;
constexpr unsigned int c_legacy_elementals_count= 7u;

int ReadInt16Value( LoadStream& stream );
int ReadInt32Value( LoadStream& stream );

void ReadStats16( LoadStream& stream, Stats& out_stats );
void ReadStats32( LoadStream& stream, Stats& out_stats );

// Arrays with int32 count prefix.
void ReadSizedInt32Array( LoadStream& stream, std::vector<int>& out_array );
void ReadSizedFloatArray( LoadStream& stream, std::vector<float>& out_array );

void ReadFloatArray( LoadStream& stream, unsigned int count, std::vector<float>& out_array );

// Count, than pairs of sized strings.
void ReadMetadata( LoadStream& stream, std::map<std::string, std::string>& out_metadata );

// Decodes records of one RELD tag. Each block of this tag contains one record.
template<class Record, class Func>
void DecodeReldRecords(
	const LumpData& data,
	const ReldTag tag,
	std::vector<Record>& out_records,
	const Func& decode_record )
{
	ReadReldBlocks(
		data,
		[&]( ReldBlock& block ) -> bool
		{
			if( block.tag != tag )
				return false;

			Record record;
			decode_record( block.payload, record );
			out_records.push_back( std::move(record) );
			return true;
		} );
}

// Decodes fixed-size records. Each record is decoded from own stream, limited by record size.
// Records with empty names are unused slots and dropped.
template<class Record, class Func>
void DecodeLegacyRecords(
	const LumpData& data,
	const unsigned int record_size,
	const char* const category,
	std::vector<Record>& out_records,
	const Func& decode_record )
{
	const unsigned int record_count= static_cast<unsigned int>( data.size() / record_size );
	unsigned int dropped= 0u;

	for( unsigned int i= 0u; i < record_count; i++ )
	{
		LoadStream stream( data.data() + i * record_size, record_size );

		Record record;
		decode_record( stream, record );

		if( record.name.empty() )
		{
			dropped++;
			continue;
		}
		out_records.push_back( std::move(record) );
	}

	if( data.size() % record_size != 0u )
		Log::Warning( "Legacy ", category, " data has ", data.size() % record_size, " trailing bytes" );

	Log::Info( "Legacy ", category, ": ", record_count, " records, ", dropped, " empty" );
}

} // namespace RpgArchive
