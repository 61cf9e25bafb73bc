#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "fwd.hpp"

namespace RpgArchive
{

struct Stats
{
	int hp= 0;
	int mp= 0;
	int attack= 0;
	int defense= 0;
	int speed= 0;
	int magic= 0;
	int magic_defense= 0;
	int luck= 0;
};

struct XYPair
{
	int x= 0;
	int y= 0;
};

struct GeneralData
{
	int version= 0; // Version of RELD chunk. Zero for legacy data.

	std::string title;
	std::string author;

	int starting_map= 0;
	int starting_x= 0;
	int starting_y= 0;
	int starting_gold= 0;
	std::vector<int> starting_heroes;
	std::vector<int> starting_items;

	// Legacy-only settings.
	int max_map= 0;
	int title_music= 0;
	int victory_music= 0;
	int battle_music= 0;
	int max_hero= 0;
	int max_enemy= 0;
	int max_attack= 0;
	int max_tile= 0;
	int max_formation= 0;
	int max_palette= 0;
	int max_textbox= 0;
	int plotscripts_count= 0;
	int new_game_script= 0;
};

struct HeroData
{
	std::string name;

	int picture= 0;
	int palette= 0;
	int portrait= 0;
	int portrait_palette= 0;

	Stats stats;

	std::vector<int> level_mp;
	std::vector<float> elementals;
	std::vector<XYPair> hand_positions;

	// Legacy-only fields.
	int walkabout_picture= 0;
	int walkabout_palette= 0;
	int default_level= 0;
	int default_weapon= 0;
	int have_tag= 0;
	int alive_tag= 0;
	int leader_tag= 0;
	int active_tag= 0;
	int max_name_length= 0;
};

struct EnemyData
{
	struct Attack
	{
		int type= 0;
		int power= 0;
		int accuracy= 0;
		int element= 0;
		int effect= 0;
	};

	std::string name;

	int picture= 0;
	int palette= 0;
	int death_picture= 0;
	int death_palette= 0;

	Stats stats;

	int behavior= 0;
	int aggression= 0;
	int intelligence= 0;

	int experience_reward= 0;
	int gold_reward= 0;
	int item_drop= 0;
	float item_drop_chance= 0.0f;

	std::vector<float> elementals;
	std::vector<Attack> attacks;
};

struct MapData
{
	static constexpr int c_default_size= 50;
	static constexpr int c_min_width= 16;
	static constexpr int c_min_height= 10;
	static constexpr int c_max_size= 32768;
	static constexpr int c_default_layers= 3;
	static constexpr int c_max_layers= 10;

	struct Npc
	{
		int x= 0;
		int y= 0;
		int picture= 0;
		int palette= 0;
		int movement_type= 0;
		int movement_speed= 0;
		int script= 0;
	};

	struct Event
	{
		int id= 0;
		int x= 0;
		int y= 0;
		int trigger= 0;
		int script= 0;
	};

	int width= 0;
	int height= 0;
	int background= 0;
	int music= 0;
	int tileset_id= 0;

	// All layers cells are accesible via layer[ x + y * width ].
	std::vector< std::vector<int32_t> > layers;

	// Cell is passable, if value is non-zero. Same indexing, as for layers.
	std::vector<unsigned char> passability;

	std::vector<Npc> npcs;
	std::vector<Event> events;
};

struct ItemData
{
	std::string name;
	std::string description;

	int picture= 0;
	int palette= 0;
	int item_type= 0;
	int price= 0;
	int usable_by= 0;
	int effect= 0;
	int effect_arg= 0;
	int effect_arg2= 0;

	Stats stat_bonus;
	std::vector<float> elementals;
};

struct SpellData
{
	std::string name;
	std::string description;

	int picture= 0;
	int palette= 0;
	int spell_type= 0;
	int mp_cost= 0;
	int target_type= 0;
	int effect= 0;
	int effect_arg1= 0;
	int effect_arg2= 0;
	int effect_arg3= 0;
	int power= 0;
	int accuracy= 0;
	int element= 0;
	int animation= 0;
	int sound_effect= 0;
};

struct ScriptData
{
	struct Constant
	{
		enum class Kind
		{
			None, // Unknown kind in file. Has no payload.
			String,
			Int,
			Float,
		};

		Kind kind= Kind::None;
		std::string string_value;
		int int_value= 0;
		float float_value= 0.0f;
	};

	int id= 0;
	std::string name;
	int script_type= 0;

	std::vector<unsigned char> bytecode;
	std::vector<Constant> constants;
	std::map<std::string, int> labels; // Label name to bytecode offset.
};

struct TextureData
{
	static constexpr int c_format_indexed= 3;

	int id= 0;
	std::string name;
	int width= 0;
	int height= 0;
	int format= 0;
	int palette= 0;

	std::vector<unsigned char> pixel_data;
	std::vector<unsigned char> palette_data; // Only for indexed format.
	std::map<std::string, std::string> metadata;
};

struct AudioData
{
	int id= 0;
	std::string name;
	int audio_type= 0;
	int format= 0;
	int sample_rate= 0;
	int channels= 0;
	int bit_depth= 0;

	std::vector<unsigned char> data;
	std::map<std::string, std::string> metadata;
};

struct SaveData
{
	struct InventoryItem
	{
		int item_id= 0;
		int quantity= 0;
		bool equipped= false;
	};

	struct PartyMember
	{
		std::string name;
		int level= 0;
		int experience= 0;
		Stats stats;
	};

	struct Player
	{
		std::string name;
		int level= 0;
		int experience= 0;
		int gold= 0;
		Stats stats;
		int x= 0;
		int y= 0;
		int map_id= 0;
		int direction= 0;

		std::vector<InventoryItem> inventory;
		std::vector<PartyMember> party;
	};

	int id= 0;
	std::string name;
	int64_t timestamp= 0; // Raw value, as stored in file.
	int game_version= 0;

	Player player;
	std::map<std::string, bool> flags;
};

struct TilesetData
{
	struct Animation
	{
		int tile_id= 0;
		int frame_delay= 0;
		std::vector<int> frames;
	};

	int id= 0;
	int version= 0;
	int tile_size= 0;
	bool has_animations= false;

	// Graphics of each tile. Broken tiles are empty.
	std::vector< std::vector<unsigned char> > tiles;
	std::vector<unsigned char> palette;
	std::vector<Animation> animations;
	std::map<std::string, std::string> metadata;
};

// Snapshot of all game data of one archive.
// All arrays exist always, but may be empty.
struct GameData
{
	bool has_general= false;
	GeneralData general;

	std::vector<HeroData> heroes;
	std::vector<EnemyData> enemies;
	std::vector<MapData> maps;
	std::vector<ItemData> items;
	std::vector<SpellData> spells;
	std::vector<ScriptData> scripts;
	std::vector<TextureData> textures;
	std::vector<AudioData> audio;
	std::vector<SaveData> saves;
	std::vector<TilesetData> tilesets;
};

} // namespace RpgArchive
