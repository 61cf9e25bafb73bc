#pragma once
#include <vector>

#include "fwd.hpp"
#include "game_data.hpp"

namespace RpgArchive
{

// Decoders of game data lumps.
// Each decoder accepts both RELD chunks and legacy fixed-stride data, format is selected by "RELD" marker.
// Malformed data causes DecodeError.

// Sizes of records in legacy lumps.
constexpr unsigned int c_legacy_hero_size= 256u;
constexpr unsigned int c_legacy_enemy_size= 160u;
constexpr unsigned int c_legacy_item_size= 128u;
constexpr unsigned int c_legacy_spell_size= 96u;
constexpr unsigned int c_legacy_script_size= 64u;
constexpr unsigned int c_legacy_texture_size= 48u;
constexpr unsigned int c_legacy_audio_size= 56u;
constexpr unsigned int c_legacy_save_size= 1024u;

void DecodeGeneralData( const LumpData& data, GeneralData& out_general );
void DecodeHeroData( const LumpData& data, std::vector<HeroData>& out_heroes );
void DecodeEnemyData( const LumpData& data, std::vector<EnemyData>& out_enemies );
void DecodeMapData( const LumpData& data, std::vector<MapData>& out_maps );
void DecodeItemData( const LumpData& data, std::vector<ItemData>& out_items );
void DecodeSpellData( const LumpData& data, std::vector<SpellData>& out_spells );
void DecodeScriptData( const LumpData& data, std::vector<ScriptData>& out_scripts );
void DecodeTextureData( const LumpData& data, std::vector<TextureData>& out_textures );
void DecodeAudioData( const LumpData& data, std::vector<AudioData>& out_audio );
void DecodeSaveData( const LumpData& data, std::vector<SaveData>& out_saves );

// Tilesets have only "RGFX" format. Damaged trailing sections are left empty.
// Returns false, if data has no "RGFX" header.
bool DecodeTilesetData( const LumpData& data, TilesetData& out_tileset );

} // namespace RpgArchive
