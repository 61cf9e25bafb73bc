#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "archive.hpp"
#include "fwd.hpp"
#include "game_data.hpp"

namespace RpgArchive
{

enum class DataCategory
{
	General,
	Heroes,
	Enemies,
	Maps,
	Items,
	Spells,
	Scripts,
	Textures,
	Audio,
	Saves,
};

const char* DataCategoryName( DataCategory category );

// Loads game data from archive.
// Not thread-safe, caller must serialize all calls.
class GameDataLoader final
{
public:
	GameDataLoader();
	~GameDataLoader();

	// Loads archive, than all game data from it.
	// Returns nullptr, if archive can not be loaded. Broken categories are logged and left empty.
	GameDataConstPtr LoadGameData( const std::filesystem::path& path );

	bool LoadArchive( const std::filesystem::path& path );
	const Archive& GetArchive() const;

	// Project name is prefix of legacy lump names.
	// By default it is upper-case stem of archive path. Empty string resets override.
	void SetProjectName( const std::string& project_name );
	std::string GetProjectName() const;

	// Names of lumps, where data of category may be stored, in order of priority.
	void GetCategoryLumpNames( DataCategory category, std::vector<std::string>& out_names ) const;

	// Returns nullptr, if no lump of category exists.
	const LumpData* FindCategoryLump( DataCategory category, std::string* out_lump_name= nullptr ) const;

	// Category loaders. Return false, if there is no lump for category.
	// Throw DecodeError, if lump is broken.
	bool LoadGeneralData( GeneralData& out_general ) const;
	bool LoadHeroData( std::vector<HeroData>& out_heroes ) const;
	bool LoadEnemyData( std::vector<EnemyData>& out_enemies ) const;
	bool LoadMapData( std::vector<MapData>& out_maps ) const;
	bool LoadItemData( std::vector<ItemData>& out_items ) const;
	bool LoadSpellData( std::vector<SpellData>& out_spells ) const;
	bool LoadScriptData( std::vector<ScriptData>& out_scripts ) const;
	bool LoadTextureData( std::vector<TextureData>& out_textures ) const;
	bool LoadAudioData( std::vector<AudioData>& out_audio ) const;
	bool LoadSaveData( std::vector<SaveData>& out_saves ) const;

	// Tilesets stored in lumps "tilesetNNN.rgfx".
	bool LoadTilesetData( int tileset_id, TilesetData& out_tileset ) const;
	bool IsTilesetAvailable( int tileset_id ) const;
	// Result is sorted.
	void GetAvailableTilesetIds( std::vector<int>& out_ids ) const;

private:
	GameDataLoader( const GameDataLoader& )= delete;
	GameDataLoader& operator=( const GameDataLoader& )= delete;

	template<class Func>
	bool LoadCategory( DataCategory category, const Func& decode ) const;

	void GetTilesetLumpNames( int tileset_id, std::vector<std::string>& out_names ) const;

private:
	Archive archive_;
	std::string project_name_override_;
};

} // namespace RpgArchive
