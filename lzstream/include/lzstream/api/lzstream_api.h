#pragma once

#ifdef LZSTREAM_SHARED
#if defined( _WIN32 ) && !defined( EFIX64 ) && !defined( EFI32 )
#ifdef LZSTREAM_EXPORT
#define LZSTREAM_API __declspec( dllexport )
#else
#define LZSTREAM_API __declspec( dllimport )
#endif
#else
#define LZSTREAM_API __attribute__( ( visibility( "default" ) ) )
#endif
#else
#define LZSTREAM_API
#endif
