#include "decoder_common.hpp"
#include "reld.hpp"

#include "record_decoders.hpp"

namespace RpgArchive
{

namespace
{

constexpr unsigned int g_legacy_hero_name_size= 16u;
constexpr unsigned int g_legacy_hero_spell_lists_size= 128u;
constexpr unsigned int g_legacy_hero_list_names_size= 30u;
constexpr unsigned int g_legacy_hero_hand_positions= 2u;

constexpr unsigned int g_legacy_enemy_attacks= 4u;

void DecodeReldHero( LoadStream& stream, HeroData& hero )
{
	stream.ReadSizedString( hero.name );

	hero.picture= ReadInt32Value( stream );
	hero.palette= ReadInt32Value( stream );
	hero.portrait= ReadInt32Value( stream );
	hero.portrait_palette= ReadInt32Value( stream );

	ReadStats32( stream, hero.stats );

	ReadSizedInt32Array( stream, hero.level_mp );
	ReadSizedFloatArray( stream, hero.elementals );

	const unsigned int hand_positions_count= stream.ReadCount( 2u * sizeof(int32_t) );
	hero.hand_positions.resize( hand_positions_count );
	for( XYPair& pos : hero.hand_positions )
	{
		pos.x= ReadInt32Value( stream );
		pos.y= ReadInt32Value( stream );
	}
}

/*
	Legacy hero record layout:
	0   name
	16  picture, palette, walkabout picture, walkabout palette, default level, default weapon
	28  stats
	44  spell lists
	172 portrait, portrait palette
	176 spell lists names
	206 have tag, alive tag, leader tag, active tag, max name length
	216 hand positions
	224 elementals
	252 reserved
*/
void DecodeLegacyHero( LoadStream& stream, HeroData& hero )
{
	stream.ReadFixedString( g_legacy_hero_name_size, hero.name );

	hero.picture= ReadInt16Value( stream );
	hero.palette= ReadInt16Value( stream );
	hero.walkabout_picture= ReadInt16Value( stream );
	hero.walkabout_palette= ReadInt16Value( stream );
	hero.default_level= ReadInt16Value( stream );
	hero.default_weapon= ReadInt16Value( stream );

	ReadStats16( stream, hero.stats );

	stream.Skip( g_legacy_hero_spell_lists_size );

	hero.portrait= ReadInt16Value( stream );
	hero.portrait_palette= ReadInt16Value( stream );

	stream.Skip( g_legacy_hero_list_names_size );

	hero.have_tag= ReadInt16Value( stream );
	hero.alive_tag= ReadInt16Value( stream );
	hero.leader_tag= ReadInt16Value( stream );
	hero.active_tag= ReadInt16Value( stream );
	hero.max_name_length= ReadInt16Value( stream );

	hero.hand_positions.resize( g_legacy_hero_hand_positions );
	for( XYPair& pos : hero.hand_positions )
	{
		pos.x= ReadInt16Value( stream );
		pos.y= ReadInt16Value( stream );
	}

	ReadFloatArray( stream, c_legacy_elementals_count, hero.elementals );
}

void DecodeReldEnemy( LoadStream& stream, EnemyData& enemy )
{
	stream.ReadSizedString( enemy.name );

	enemy.picture= ReadInt32Value( stream );
	enemy.palette= ReadInt32Value( stream );
	enemy.death_picture= ReadInt32Value( stream );
	enemy.death_palette= ReadInt32Value( stream );

	ReadStats32( stream, enemy.stats );

	enemy.behavior= ReadInt32Value( stream );
	enemy.aggression= ReadInt32Value( stream );
	enemy.intelligence= ReadInt32Value( stream );

	enemy.experience_reward= ReadInt32Value( stream );
	enemy.gold_reward= ReadInt32Value( stream );
	enemy.item_drop= ReadInt32Value( stream );
	stream.ReadFloat( enemy.item_drop_chance );

	ReadSizedFloatArray( stream, enemy.elementals );

	const unsigned int attacks_count= stream.ReadCount( 5u * sizeof(int32_t) );
	enemy.attacks.resize( attacks_count );
	for( EnemyData::Attack& attack : enemy.attacks )
	{
		attack.type= ReadInt32Value( stream );
		attack.power= ReadInt32Value( stream );
		attack.accuracy= ReadInt32Value( stream );
		attack.element= ReadInt32Value( stream );
		attack.effect= ReadInt32Value( stream );
	}
}

/*
	Legacy enemy record layout:
	0   name
	32  picture, palette, death picture, death palette
	48  stats
	80  behavior, aggression, intelligence
	92  experience, gold, item drop, item drop chance
	108 elementals
	136 attacks
*/
void DecodeLegacyEnemy( LoadStream& stream, EnemyData& enemy )
{
	stream.ReadFixedString( c_fixed_name_size, enemy.name );

	enemy.picture= ReadInt32Value( stream );
	enemy.palette= ReadInt32Value( stream );
	enemy.death_picture= ReadInt32Value( stream );
	enemy.death_palette= ReadInt32Value( stream );

	ReadStats32( stream, enemy.stats );

	enemy.behavior= ReadInt32Value( stream );
	enemy.aggression= ReadInt32Value( stream );
	enemy.intelligence= ReadInt32Value( stream );

	enemy.experience_reward= ReadInt32Value( stream );
	enemy.gold_reward= ReadInt32Value( stream );
	enemy.item_drop= ReadInt32Value( stream );
	stream.ReadFloat( enemy.item_drop_chance );

	ReadFloatArray( stream, c_legacy_elementals_count, enemy.elementals );

	enemy.attacks.resize( g_legacy_enemy_attacks );
	for( EnemyData::Attack& attack : enemy.attacks )
	{
		uint8_t type, element;
		stream.ReadUInt8( type );
		stream.ReadUInt8( element );
		attack.type= type;
		attack.element= element;
		attack.power= ReadInt16Value( stream );
		attack.accuracy= ReadInt16Value( stream );
		attack.effect= 0;
	}
}

} // namespace

void DecodeHeroData( const LumpData& data, std::vector<HeroData>& out_heroes )
{
	out_heroes.clear();

	if( IsReldChunk( data ) )
		DecodeReldRecords( data, ReldTag::Hero, out_heroes, DecodeReldHero );
	else
		DecodeLegacyRecords( data, c_legacy_hero_size, "heroes", out_heroes, DecodeLegacyHero );
}

void DecodeEnemyData( const LumpData& data, std::vector<EnemyData>& out_enemies )
{
	out_enemies.clear();

	if( IsReldChunk( data ) )
		DecodeReldRecords( data, ReldTag::Enemy, out_enemies, DecodeReldEnemy );
	else
		DecodeLegacyRecords( data, c_legacy_enemy_size, "enemies", out_enemies, DecodeLegacyEnemy );
}

} // namespace RpgArchive
