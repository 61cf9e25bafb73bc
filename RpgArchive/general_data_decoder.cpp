#include "decoder_common.hpp"
#include "reld.hpp"

#include "record_decoders.hpp"

namespace RpgArchive
{

namespace
{

// Legacy general data has values at fixed byte offsets.
// Fields may overlap, title covers bytes of some of them.
namespace GeneralOffsets
{

const unsigned int max_map= 0u;
const unsigned int title= 1u;
const unsigned int title_music= 2u;
const unsigned int victory_music= 3u;
const unsigned int battle_music= 4u;
const unsigned int max_tile= 33u;
const unsigned int max_attack= 34u;
const unsigned int max_hero= 35u;
const unsigned int max_enemy= 36u;
const unsigned int max_formation= 37u;
const unsigned int max_palette= 38u;
const unsigned int max_textbox= 39u;
const unsigned int plotscripts_count= 40u;
const unsigned int new_game_script= 41u;
const unsigned int start_money= 96u;
const unsigned int start_x= 102u;
const unsigned int start_y= 103u;
const unsigned int start_map= 104u;

} // namespace GeneralOffsets

constexpr unsigned int g_legacy_title_size= 32u;

int ReadLegacyValue( LoadStream& stream, const unsigned int offset )
{
	stream.SetBufferPos( offset );
	return ReadInt16Value( stream );
}

void ReadInt32List( LoadStream& stream, std::vector<int>& out_list )
{
	out_list.resize( stream.GetSize() / sizeof(int32_t) );
	for( int& value : out_list )
		value= ReadInt32Value( stream );
}

void DecodeReldGeneralData( const LumpData& data, GeneralData& out_general )
{
	out_general.version= ReadReldBlocks(
		data,
		[&]( ReldBlock& block ) -> bool
		{
			LoadStream& stream= block.payload;
			switch( block.tag )
			{
			case ReldTag::Title:
				stream.ReadFixedString( stream.GetSize(), out_general.title );
				return true;
			case ReldTag::Author:
				stream.ReadFixedString( stream.GetSize(), out_general.author );
				return true;
			case ReldTag::StartMap:
				out_general.starting_map= ReadInt32Value( stream );
				return true;
			case ReldTag::StartX:
				out_general.starting_x= ReadInt32Value( stream );
				return true;
			case ReldTag::StartY:
				out_general.starting_y= ReadInt32Value( stream );
				return true;
			case ReldTag::StartGold:
				out_general.starting_gold= ReadInt32Value( stream );
				return true;
			case ReldTag::StartHeroes:
				ReadInt32List( stream, out_general.starting_heroes );
				return true;
			case ReldTag::StartItems:
				ReadInt32List( stream, out_general.starting_items );
				return true;
			default:
				return false;
			};
		} );
}

void DecodeLegacyGeneralData( const LumpData& data, GeneralData& out_general )
{
	LoadStream stream( data );

	out_general.version= 0;

	stream.SetBufferPos( GeneralOffsets::title );
	stream.ReadFixedString( g_legacy_title_size, out_general.title );

	out_general.max_map= ReadLegacyValue( stream, GeneralOffsets::max_map );
	out_general.title_music= ReadLegacyValue( stream, GeneralOffsets::title_music );
	out_general.victory_music= ReadLegacyValue( stream, GeneralOffsets::victory_music );
	out_general.battle_music= ReadLegacyValue( stream, GeneralOffsets::battle_music );
	out_general.max_tile= ReadLegacyValue( stream, GeneralOffsets::max_tile );
	out_general.max_attack= ReadLegacyValue( stream, GeneralOffsets::max_attack );
	out_general.max_hero= ReadLegacyValue( stream, GeneralOffsets::max_hero );
	out_general.max_enemy= ReadLegacyValue( stream, GeneralOffsets::max_enemy );
	out_general.max_formation= ReadLegacyValue( stream, GeneralOffsets::max_formation );
	out_general.max_palette= ReadLegacyValue( stream, GeneralOffsets::max_palette );
	out_general.max_textbox= ReadLegacyValue( stream, GeneralOffsets::max_textbox );
	out_general.plotscripts_count= ReadLegacyValue( stream, GeneralOffsets::plotscripts_count );
	out_general.new_game_script= ReadLegacyValue( stream, GeneralOffsets::new_game_script );
	out_general.starting_gold= ReadLegacyValue( stream, GeneralOffsets::start_money );
	out_general.starting_x= ReadLegacyValue( stream, GeneralOffsets::start_x );
	out_general.starting_y= ReadLegacyValue( stream, GeneralOffsets::start_y );
	out_general.starting_map= ReadLegacyValue( stream, GeneralOffsets::start_map );

	Log::Info( "Legacy general data: title \"", out_general.title, "\", max hero: ", out_general.max_hero, ", max map: ", out_general.max_map );
}

} // namespace

void DecodeGeneralData( const LumpData& data, GeneralData& out_general )
{
	out_general= GeneralData();

	if( IsReldChunk( data ) )
		DecodeReldGeneralData( data, out_general );
	else
		DecodeLegacyGeneralData( data, out_general );
}

} // namespace RpgArchive
