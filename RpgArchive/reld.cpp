#include <cstring>

#include "assert.hpp"
#include "log.hpp"

#include "reld.hpp"

namespace RpgArchive
{

namespace
{

struct TagDescription
{
	ReldTag tag;
	char name[ c_reld_tag_size + 1u ];
};

const TagDescription g_known_tags[]
{
	{ ReldTag::Title, "TITL" },
	{ ReldTag::Author, "AUTH" },
	{ ReldTag::StartMap, "STMP" },
	{ ReldTag::StartX, "STX " },
	{ ReldTag::StartY, "STY " },
	{ ReldTag::StartGold, "STGL" },
	{ ReldTag::StartHeroes, "STHR" },
	{ ReldTag::StartItems, "STIT" },
	{ ReldTag::Hero, "HERO" },
	{ ReldTag::Enemy, "ENEM" },
	{ ReldTag::Map, "MAP " },
	{ ReldTag::Item, "ITEM" },
	{ ReldTag::Spell, "SPEL" },
	{ ReldTag::Script, "SCRP" },
	{ ReldTag::Texture, "TEXT" },
	{ ReldTag::Audio, "AUDI" },
	{ ReldTag::Save, "SAVE" },
};

} // namespace

ReldTag ReldTagFromName( const std::string& name )
{
	for( const TagDescription& description : g_known_tags )
	{
		if( name == description.name )
			return description.tag;
	}

	return ReldTag::Unknown;
}

const char* ReldTagName( const ReldTag tag )
{
	for( const TagDescription& description : g_known_tags )
	{
		if( description.tag == tag )
			return description.name;
	}

	return "";
}

bool IsReldChunk( const LumpData& data )
{
	return
		data.size() > sizeof(c_reld_marker) &&
		std::memcmp( data.data(), c_reld_marker, sizeof(c_reld_marker) ) == 0;
}

int32_t ReadReldBlocks( const LumpData& data, const ReldBlockHandler& handler )
{
	RA_ASSERT( IsReldChunk( data ) );

	LoadStream stream( data, sizeof(c_reld_marker) );

	int32_t version;
	stream.ReadInt32( version );

	while( !stream.AtEnd() )
	{
		const unsigned int block_start= stream.GetBufferPos();

		std::string tag_name;
		stream.ReadFixedString( c_reld_tag_size, tag_name );

		int32_t block_size;
		stream.ReadInt32( block_size );
		if( block_size < 0 )
			throw DecodeError( "Negative size of block \"" + tag_name + "\" at offset " + std::to_string(block_start) );

		ReldBlock block{ ReldTagFromName( tag_name ), tag_name, stream.SubStream( static_cast<unsigned int>(block_size) ) };

		if( block.tag == ReldTag::Unknown || !handler( block ) )
			Log::Info( "Skipping RELD block \"", tag_name, "\" of size ", block_size );
	}

	return version;
}

} // namespace RpgArchive
