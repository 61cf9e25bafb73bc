#pragma once
#include <memory>
#include <vector>

// Forward declarations, basic typedefs here.

namespace RpgArchive
{

typedef std::vector<unsigned char> LumpData;

class LumpStore;

class Archive;

struct ModernContainerDirectory;

struct GeneralData;

struct GameData;
typedef std::shared_ptr<GameData> GameDataPtr;
typedef std::shared_ptr<const GameData> GameDataConstPtr;

class GameDataLoader;

class LoadStream;
class SaveStream;

class Settings;

} // namespace RpgArchive
