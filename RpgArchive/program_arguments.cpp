#include "program_arguments.hpp"

namespace RpgArchive
{

ProgramArguments::ProgramArguments( const int argc, const char* const* const argv )
	: argc_( argc > 0 ? static_cast<unsigned int>(argc) : 0u )
	, argv_( argv )
{}

ProgramArguments::~ProgramArguments()
{}

bool ProgramArguments::IsParam( const char* const arg, const char* const param_name )
{
	return arg[0] == '-' && arg[1] == '-' && std::strcmp( param_name, arg + 2u ) == 0;
}

bool ProgramArguments::HasParam( const char* const param_name ) const
{
	for( unsigned int i= 0u; i < argc_; i++ )
	{
		if( IsParam( argv_[i], param_name ) )
			return true;
	}

	return false;
}

const char* ProgramArguments::GetParamValue( const char* const param_name ) const
{
	for( unsigned int i= 0u; i < argc_; i++ )
	{
		if( IsParam( argv_[i], param_name ) )
		{
			if( i + 1u < argc_ )
				return argv_[ i + 1u ];
			else
				return nullptr;
		}
	}

	return nullptr;
}

const char* ProgramArguments::GetParamValue( const char* const param_name, const char* const default_value ) const
{
	const char* const value= GetParamValue( param_name );
	return value == nullptr ? default_value : value;
}

} // namespace RpgArchive
