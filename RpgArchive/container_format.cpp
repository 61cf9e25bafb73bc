#include <algorithm>
#include <cstring>
#include <fstream>

#include <physfs.h>

#include "common/files.hpp"
#include "common/str.hpp"
#include "log.hpp"
#include "lump_store.hpp"
#include "save_stream.hpp"

#include "container_format.hpp"

namespace RpgArchive
{

namespace
{

constexpr unsigned int g_modern_header_size= sizeof(ModernContainerHeader);
constexpr unsigned int g_modern_entry_size= sizeof(ModernContainerEntryPacked);

const char* PhysFsLastError()
{
	const char* const error= PHYSFS_getErrorByCode( PHYSFS_getLastErrorCode() );
	return error == nullptr ? "unknown error" : error;
}

// Mounts directory for reading. Initializes PhysFS, if it is not yet initialized.
class PhysFsMount final
{
public:
	explicit PhysFsMount( const std::filesystem::path& dir )
		: dir_( dir.string() )
	{
		if( PHYSFS_isInit() == 0 )
		{
			if( PHYSFS_init( "" ) == 0 )
			{
				Log::Warning( "PHYSFS_init() failed, reason: ", PhysFsLastError() );
				return;
			}
			initialized_here_= true;
			PHYSFS_permitSymbolicLinks( 1 );
		}

		if( PHYSFS_mount( dir_.c_str(), "/", 0 ) == 0 )
		{
			Log::Warning( "Can not mount directory \"", dir_, "\", reason: ", PhysFsLastError() );
			return;
		}
		mounted_= true;
	}

	~PhysFsMount()
	{
		if( mounted_ )
			PHYSFS_unmount( dir_.c_str() );
		if( initialized_here_ )
			PHYSFS_deinit();
	}

	bool IsMounted() const { return mounted_; }

private:
	PhysFsMount( const PhysFsMount& )= delete;
	PhysFsMount& operator=( const PhysFsMount& )= delete;

private:
	const std::string dir_;
	bool initialized_here_= false;
	bool mounted_= false;
};

struct PhysFsFileCloser
{
	void operator()( PHYSFS_File* const file ) const
	{
		if( file != nullptr )
			PHYSFS_close( file );
	}
};

typedef std::unique_ptr<PHYSFS_File, PhysFsFileCloser> PhysFsFilePtr;

struct PhysFsListDeleter
{
	void operator()( char** const list ) const
	{
		if( list != nullptr )
			PHYSFS_freeList( list );
	}
};

typedef std::unique_ptr<char*, PhysFsListDeleter> PhysFsListPtr;

bool ReadPhysFsFile( const std::string& file_name, LumpData& out_data )
{
	const PhysFsFilePtr file( PHYSFS_openRead( file_name.c_str() ) );
	if( file == nullptr )
	{
		Log::Warning( "Can not open \"", file_name, "\", reason: ", PhysFsLastError() );
		return false;
	}

	const PHYSFS_sint64 file_size= PHYSFS_fileLength( file.get() );
	if( file_size < 0 )
	{
		Log::Warning( "Can not get length of \"", file_name, "\"" );
		return false;
	}

	out_data.resize( static_cast<size_t>(file_size) );
	const PHYSFS_sint64 read= PHYSFS_readBytes( file.get(), out_data.data(), static_cast<PHYSFS_uint64>( out_data.size() ) );
	if( read != file_size )
	{
		Log::Warning( "Can not read \"", file_name, "\", reason: ", PhysFsLastError() );
		return false;
	}

	return true;
}

// "dir" is empty for root, otherwise it has no leading and trailing '/'.
bool ReadPhysFsDirectory( const std::string& dir, LumpStore& out_store )
{
	const PhysFsListPtr list( PHYSFS_enumerateFiles( dir.c_str() ) );
	if( list == nullptr )
	{
		Log::Warning( "Can not enumerate \"", dir, "\", reason: ", PhysFsLastError() );
		return false;
	}

	for( char** name= list.get(); *name != nullptr; name++ )
	{
		const std::string file_name= dir.empty() ? std::string(*name) : dir + "/" + *name;

		PHYSFS_Stat stat;
		if( PHYSFS_stat( file_name.c_str(), &stat ) == 0 )
		{
			Log::Warning( "Can not stat \"", file_name, "\", reason: ", PhysFsLastError() );
			return false;
		}

		if( stat.filetype == PHYSFS_FILETYPE_DIRECTORY )
		{
			if( !ReadPhysFsDirectory( file_name, out_store ) )
				return false;
		}
		else if( stat.filetype == PHYSFS_FILETYPE_REGULAR || stat.filetype == PHYSFS_FILETYPE_SYMLINK )
		{
			LumpData data;
			if( !ReadPhysFsFile( file_name, data ) )
				return false;
			out_store.Put( file_name, std::move(data) );
		}
	}

	return true;
}

} // namespace

const char* ContainerKindName( const ContainerKind kind )
{
	switch( kind )
	{
	case ContainerKind::None: return "none";
	case ContainerKind::Directory: return "directory";
	case ContainerKind::Modern: return "modern";
	case ContainerKind::Legacy: return "legacy";
	};

	RA_ASSERT(false);
	return "";
}

ContainerKind DetectContainerKind( const std::filesystem::path& path )
{
	if( path.empty() )
		return ContainerKind::None;

	std::error_code ec;
	if( std::filesystem::is_directory( path, ec ) )
		return ContainerKind::Directory;
	if( !std::filesystem::is_regular_file( path, ec ) )
		return ContainerKind::None;

	std::ifstream is( path, std::ios_base::binary );
	if( !is.is_open() )
		return ContainerKind::None;

	char magic[ sizeof(c_modern_container_magic) ]= { 0 };
	is.read( magic, sizeof(magic) );
	if( is.gcount() == sizeof(magic) && std::memcmp( magic, c_modern_container_magic, sizeof(magic) ) == 0 )
		return ContainerKind::Modern;

	return ContainerKind::Legacy;
}

bool ReadDirectoryTree( const std::filesystem::path& root, LumpStore& out_store )
{
	const PhysFsMount mount( root );
	if( !mount.IsMounted() )
		return false;

	return ReadPhysFsDirectory( "", out_store );
}

bool ReadModernContainer( const std::filesystem::path& file_path, LumpStore& out_store, ModernContainerDirectory& out_directory )
{
	std::error_code ec;
	const std::uintmax_t file_size= std::filesystem::file_size( file_path, ec );
	if( ec )
	{
		Log::Warning( "Can not get size of \"", file_path.string(), "\": ", ec.message() );
		return false;
	}

	const FilePtr file= OpenFile( file_path, "rb" );
	if( file == nullptr )
	{
		Log::Warning( "Can not open \"", file_path.string(), "\"" );
		return false;
	}

	ModernContainerHeader header;
	if( FileRead( file.get(), &header, sizeof(header) ) != sizeof(header) )
	{
		Log::Warning( "Modern container header is truncated" );
		return false;
	}

	if( header.lump_count < 0 ||
		g_modern_header_size + uint64_t(header.lump_count) * g_modern_entry_size > file_size )
	{
		Log::Warning( "Invalid lumps count in modern container: ", header.lump_count );
		return false;
	}

	out_directory.version= header.version;
	out_directory.directory_size= header.directory_size;
	out_directory.entries.clear();

	Log::Info( "Modern container version: ", header.version, ", lumps: ", header.lump_count );

	// Read whole directory first.
	std::vector<ModernContainerEntryPacked> entries_packed( static_cast<size_t>(header.lump_count) );
	const unsigned int directory_bytes= static_cast<unsigned int>( entries_packed.size() * g_modern_entry_size );
	if( FileRead( file.get(), entries_packed.data(), directory_bytes ) != directory_bytes )
	{
		Log::Warning( "Modern container directory is truncated" );
		return false;
	}

	out_directory.entries.reserve( entries_packed.size() );
	for( const ModernContainerEntryPacked& entry_packed : entries_packed )
	{
		ModernContainerDirectory::Entry entry;
		entry.name= CutAtNull( entry_packed.name, c_modern_container_lump_name_size );
		entry.offset= entry_packed.offset;
		entry.size= entry_packed.size;
		entry.flags= entry_packed.flags;

		if( entry.offset < 0 || entry.size < 0 ||
			uint64_t(entry.offset) + uint64_t(entry.size) > file_size )
		{
			Log::Warning( "Lump \"", entry.name, "\" has invalid placement, offset: ", entry.offset, " size: ", entry.size );
			return false;
		}

		out_directory.entries.push_back( std::move(entry) );
	}

	for( const ModernContainerDirectory::Entry& entry : out_directory.entries )
	{
		LumpData data( static_cast<size_t>(entry.size) );

		if( std::fseek( file.get(), entry.offset, SEEK_SET ) != 0 ||
			FileRead( file.get(), data.data(), static_cast<unsigned int>( data.size() ) ) != data.size() )
		{
			Log::Warning( "Can not read lump \"", entry.name, "\"" );
			return false;
		}

		out_store.Put( entry.name, std::move(data) );
	}

	return true;
}

unsigned int ReadLegacyContainer( const LumpData& content, LumpStore& out_store )
{
	unsigned int pos= 0u;
	unsigned int lumps_read= 0u;

	while( pos < content.size() )
	{
		const unsigned char* const name_start= content.data() + pos;
		const void* const name_end= std::memchr( name_start, 0, content.size() - pos );
		if( name_end == nullptr )
		{
			Log::Warning( "Legacy container: lump name is not terminated at offset ", pos );
			break;
		}

		const unsigned int name_length= static_cast<unsigned int>( static_cast<const unsigned char*>(name_end) - name_start );
		if( name_length == 0u )
			break; // End of lumps.

		std::string name( reinterpret_cast<const char*>(name_start), name_length );
		pos+= name_length + 1u;

		if( content.size() - pos < sizeof(int32_t) )
		{
			Log::Warning( "Legacy container: size of lump \"", name, "\" is truncated" );
			break;
		}

		int32_t size;
		std::memcpy( &size, content.data() + pos, sizeof(int32_t) );
		pos+= sizeof(int32_t);

		if( size < 0 || uint64_t(size) > content.size() - pos )
		{
			Log::Warning( "Legacy container: invalid size ", size, " of lump \"", name, "\"" );
			break;
		}

		out_store.Put( name, LumpData( content.begin() + pos, content.begin() + pos + size ) );
		pos+= static_cast<unsigned int>(size);
		lumps_read++;
	}

	return lumps_read;
}

ModernContainerDirectory BuildModernContainerDirectory(
	const std::vector<std::string>& lump_names,
	const LumpStore& store,
	const int32_t version )
{
	ModernContainerDirectory directory;
	directory.version= version;
	directory.directory_size= static_cast<int32_t>( lump_names.size() * g_modern_entry_size );

	uint64_t offset= g_modern_header_size + uint64_t(directory.directory_size);
	for( const std::string& name : lump_names )
	{
		ModernContainerDirectory::Entry entry;
		entry.name= name;
		entry.offset= static_cast<int32_t>(offset);
		entry.size= static_cast<int32_t>( store.GetSize( name ) );
		offset+= uint64_t(entry.size);

		directory.entries.push_back( std::move(entry) );
	}

	return directory;
}

bool SerializeModernContainer( const ModernContainerDirectory& directory, const LumpStore& store, LumpData& out_bytes )
{
	out_bytes.clear();

	const uint64_t data_start= g_modern_header_size + uint64_t( directory.entries.size() ) * g_modern_entry_size;
	uint64_t total_size= data_start;

	for( const ModernContainerDirectory::Entry& entry : directory.entries )
	{
		const LumpData* const data= store.Get( entry.name );
		if( data == nullptr || entry.size < 0 || data->size() != size_t(entry.size) )
		{
			Log::Warning( "Lump \"", entry.name, "\" is missing or has different size" );
			return false;
		}
		if( entry.name.size() > c_modern_container_lump_name_size )
		{
			Log::Warning( "Lump name \"", entry.name, "\" is too long" );
			return false;
		}
		if( entry.offset < 0 || ( uint64_t(entry.offset) < data_start && entry.size > 0 ) )
		{
			Log::Warning( "Lump \"", entry.name, "\" overlaps container directory" );
			return false;
		}

		total_size= std::max( total_size, uint64_t(entry.offset) + uint64_t(entry.size) );
	}

	SaveStream stream( out_bytes );
	stream.WriteBytes( c_modern_container_magic, sizeof(c_modern_container_magic) );
	stream.WriteInt32( directory.version );
	stream.WriteInt32( static_cast<int32_t>( directory.entries.size() ) );
	stream.WriteInt32( directory.directory_size );

	for( const ModernContainerDirectory::Entry& entry : directory.entries )
	{
		stream.WriteFixedString( entry.name, c_modern_container_lump_name_size );
		stream.WriteInt32( entry.offset );
		stream.WriteInt32( entry.size );
		stream.WriteInt32( entry.flags );
	}

	out_bytes.resize( static_cast<size_t>(total_size), 0u );
	for( const ModernContainerDirectory::Entry& entry : directory.entries )
	{
		const LumpData& data= *store.Get( entry.name );
		if( !data.empty() )
			std::memcpy( out_bytes.data() + entry.offset, data.data(), data.size() );
	}

	return true;
}

void SerializeLegacyContainer( const std::vector<std::string>& lump_names, const LumpStore& store, LumpData& out_bytes )
{
	out_bytes.clear();
	SaveStream stream( out_bytes );

	for( const std::string& name : lump_names )
	{
		const LumpData* const data= store.Get( name );
		if( data == nullptr || name.empty() )
			continue;

		stream.WriteBytes( name.c_str(), static_cast<unsigned int>( name.size() + 1u ) );
		stream.WriteInt32( static_cast<int32_t>( data->size() ) );
		stream.WriteBytes( *data );
	}
}

} // namespace RpgArchive
