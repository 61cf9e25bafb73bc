#include <SDL_messagebox.h>

#include "log.hpp"

namespace RpgArchive
{

Log::LogCallback Log::log_callback_;
Log::LogLevel Log::console_level_= Log::LogLevel::Info;
std::ofstream Log::log_file_{ "rpg_archive.log" };

void Log::SetLogCallback( LogCallback callback )
{
	log_callback_= std::move(callback);
}

void Log::SetConsoleLevel( const LogLevel level )
{
	console_level_= level;
}

void Log::ShowFatalMessageBox( const std::string& error_message )
{
	SDL_ShowSimpleMessageBox(
		SDL_MESSAGEBOX_ERROR,
		"Fatal error",
		error_message.c_str(),
		nullptr );
}

} // namespace RpgArchive
