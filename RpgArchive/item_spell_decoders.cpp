#include "decoder_common.hpp"
#include "reld.hpp"

#include "record_decoders.hpp"

namespace RpgArchive
{

namespace
{

typedef int (*ReadIntFunc)( LoadStream& stream );

// Fields after name and description are same in both formats, only size differs.
void ReadItemFields( LoadStream& stream, const ReadIntFunc read_int, ItemData& item )
{
	item.picture= read_int( stream );
	item.palette= read_int( stream );
	item.item_type= read_int( stream );
	item.price= read_int( stream );
	item.usable_by= read_int( stream );
	item.effect= read_int( stream );
	item.effect_arg= read_int( stream );
	item.effect_arg2= read_int( stream );
}

void ReadSpellFields( LoadStream& stream, const ReadIntFunc read_int, SpellData& spell )
{
	spell.picture= read_int( stream );
	spell.palette= read_int( stream );
	spell.spell_type= read_int( stream );
	spell.mp_cost= read_int( stream );
	spell.target_type= read_int( stream );
	spell.effect= read_int( stream );
	spell.effect_arg1= read_int( stream );
	spell.effect_arg2= read_int( stream );
	spell.effect_arg3= read_int( stream );
	spell.power= read_int( stream );
	spell.accuracy= read_int( stream );
	spell.element= read_int( stream );
	spell.animation= read_int( stream );
	spell.sound_effect= read_int( stream );
}

void DecodeReldItem( LoadStream& stream, ItemData& item )
{
	stream.ReadSizedString( item.name );
	stream.ReadSizedString( item.description );
	ReadItemFields( stream, ReadInt32Value, item );
	ReadStats32( stream, item.stat_bonus );
	ReadSizedFloatArray( stream, item.elementals );
}

/*
	Legacy item record layout:
	0   name
	32  description
	64  picture .. effect arg 2
	80  stat bonus
	96  elementals
	124 reserved
*/
void DecodeLegacyItem( LoadStream& stream, ItemData& item )
{
	stream.ReadFixedString( c_fixed_name_size, item.name );
	stream.ReadFixedString( c_fixed_name_size, item.description );
	ReadItemFields( stream, ReadInt16Value, item );
	ReadStats16( stream, item.stat_bonus );
	ReadFloatArray( stream, c_legacy_elementals_count, item.elementals );
}

void DecodeReldSpell( LoadStream& stream, SpellData& spell )
{
	stream.ReadSizedString( spell.name );
	stream.ReadSizedString( spell.description );
	ReadSpellFields( stream, ReadInt32Value, spell );
}

void DecodeLegacySpell( LoadStream& stream, SpellData& spell )
{
	stream.ReadFixedString( c_fixed_name_size, spell.name );
	stream.ReadFixedString( c_fixed_name_size, spell.description );
	ReadSpellFields( stream, ReadInt16Value, spell );
}

} // namespace

void DecodeItemData( const LumpData& data, std::vector<ItemData>& out_items )
{
	out_items.clear();

	if( IsReldChunk( data ) )
		DecodeReldRecords( data, ReldTag::Item, out_items, DecodeReldItem );
	else
		DecodeLegacyRecords( data, c_legacy_item_size, "items", out_items, DecodeLegacyItem );
}

void DecodeSpellData( const LumpData& data, std::vector<SpellData>& out_spells )
{
	out_spells.clear();

	if( IsReldChunk( data ) )
		DecodeReldRecords( data, ReldTag::Spell, out_spells, DecodeReldSpell );
	else
		DecodeLegacyRecords( data, c_legacy_spell_size, "spells", out_spells, DecodeLegacySpell );
}

} // namespace RpgArchive
