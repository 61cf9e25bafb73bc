#include "common/files.hpp"
#include "log.hpp"

#include "archive.hpp"

namespace RpgArchive
{

Archive::Archive()
{}

Archive::~Archive()
{}

bool Archive::LoadArchive( const std::filesystem::path& path )
{
	Dispose();

	bool ok= false;
	try
	{
		ok= LoadArchiveImpl( path );
	}
	catch( const std::exception& e )
	{
		Log::Warning( "Failed to load archive \"", path.string(), "\": ", e.what() );
		ok= false;
	}

	if( !ok )
	{
		Dispose();
		return false;
	}

	source_path_= path;
	loaded_= true;
	return true;
}

bool Archive::LoadArchiveImpl( const std::filesystem::path& path )
{
	container_kind_= DetectContainerKind( path );

	switch( container_kind_ )
	{
	case ContainerKind::None:
		Log::Warning( "\"", path.string(), "\" is not a directory or readable file" );
		return false;

	case ContainerKind::Directory:
		if( !ReadDirectoryTree( path, lumps_ ) )
		{
			Log::Warning( "Failed to load directory \"", path.string(), "\"" );
			return false;
		}
		Log::Info( "Loaded ", lumps_.GetCount(), " lumps from directory \"", path.string(), "\"" );
		return true;

	case ContainerKind::Modern:
		if( !ReadModernContainer( path, lumps_, modern_directory_ ) )
		{
			Log::Warning( "Failed to load modern container \"", path.string(), "\"" );
			return false;
		}
		Log::Info( "Loaded ", lumps_.GetCount(), " lumps from modern container \"", path.string(), "\"" );
		return true;

	case ContainerKind::Legacy:
		{
			LumpData content;
			if( !ReadWholeFile( path, content ) )
			{
				Log::Warning( "Can not read \"", path.string(), "\"" );
				return false;
			}

			const unsigned int lumps_read= ReadLegacyContainer( content, lumps_ );
			Log::Info( "Loaded ", lumps_read, " lumps from legacy container \"", path.string(), "\"" );
		}
		return true;
	};

	RA_ASSERT(false);
	return false;
}

void Archive::Dispose()
{
	lumps_.Clear();
	modern_directory_= ModernContainerDirectory();
	container_kind_= ContainerKind::None;
	source_path_.clear();
	loaded_= false;
}

bool Archive::IsLoaded() const
{
	return loaded_;
}

ContainerKind Archive::GetContainerKind() const
{
	return container_kind_;
}

const std::filesystem::path& Archive::GetSourcePath() const
{
	return source_path_;
}

const ModernContainerDirectory& Archive::GetModernDirectory() const
{
	return modern_directory_;
}

const LumpStore& Archive::GetLumps() const
{
	return lumps_;
}

const LumpData* Archive::GetLump( const std::string& name ) const
{
	return lumps_.Get( name );
}

bool Archive::GetLumpAsText( const std::string& name, std::string& out_text ) const
{
	return lumps_.GetAsText( name, out_text );
}

bool Archive::HasLump( const std::string& name ) const
{
	return lumps_.Has( name );
}

void Archive::GetLumpNames( std::vector<std::string>& out_names ) const
{
	lumps_.GetNames( out_names );
}

unsigned int Archive::GetLumpSize( const std::string& name ) const
{
	return lumps_.GetSize( name );
}

unsigned int Archive::GetLumpCount() const
{
	return lumps_.GetCount();
}

} // namespace RpgArchive
