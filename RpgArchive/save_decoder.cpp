#include "decoder_common.hpp"
#include "reld.hpp"

#include "record_decoders.hpp"

namespace RpgArchive
{

namespace
{

// Player data has same layout in both formats.
void ReadPlayer( LoadStream& stream, SaveData::Player& player )
{
	stream.ReadFixedString( c_fixed_name_size, player.name );
	player.level= ReadInt32Value( stream );
	player.experience= ReadInt32Value( stream );
	player.gold= ReadInt32Value( stream );

	ReadStats32( stream, player.stats );

	player.x= ReadInt32Value( stream );
	player.y= ReadInt32Value( stream );
	player.map_id= ReadInt32Value( stream );
	player.direction= ReadInt32Value( stream );
}

void DecodeReldSave( LoadStream& stream, SaveData& save )
{
	save.id= ReadInt32Value( stream );
	stream.ReadFixedString( c_fixed_name_size, save.name );
	int64_t timestamp;
	stream.ReadInt64( timestamp );
	save.timestamp= timestamp;
	save.game_version= ReadInt32Value( stream );

	ReadPlayer( stream, save.player );

	const unsigned int inventory_size= stream.ReadCount( 2u * sizeof(int32_t) + 1u );
	save.player.inventory.resize( inventory_size );
	for( SaveData::InventoryItem& item : save.player.inventory )
	{
		item.item_id= ReadInt32Value( stream );
		item.quantity= ReadInt32Value( stream );
		stream.ReadBool( item.equipped );
	}

	const unsigned int party_size= stream.ReadCount( c_fixed_name_size + 10u * sizeof(int32_t) );
	save.player.party.resize( party_size );
	for( SaveData::PartyMember& member : save.player.party )
	{
		stream.ReadFixedString( c_fixed_name_size, member.name );
		member.level= ReadInt32Value( stream );
		member.experience= ReadInt32Value( stream );
		ReadStats32( stream, member.stats );
	}

	const unsigned int flags_count= stream.ReadCount( c_fixed_name_size + 1u );
	for( unsigned int i= 0u; i < flags_count; i++ )
	{
		std::string flag_name;
		stream.ReadFixedString( c_fixed_name_size, flag_name );
		bool value;
		stream.ReadBool( value );
		save.flags[ std::move(flag_name) ]= value;
	}
}

// Legacy saves have no timestamp, inventory, party and flags.
void DecodeLegacySave( LoadStream& stream, SaveData& save )
{
	save.id= ReadInt32Value( stream );
	stream.ReadFixedString( c_fixed_name_size, save.name );
	save.game_version= ReadInt32Value( stream );

	ReadPlayer( stream, save.player );
}

} // namespace

void DecodeSaveData( const LumpData& data, std::vector<SaveData>& out_saves )
{
	out_saves.clear();

	if( IsReldChunk( data ) )
		DecodeReldRecords( data, ReldTag::Save, out_saves, DecodeReldSave );
	else
		DecodeLegacyRecords( data, c_legacy_save_size, "saves", out_saves, DecodeLegacySave );
}

} // namespace RpgArchive
