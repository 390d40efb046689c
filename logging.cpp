#include <cstring>
#include <ctime>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>

#if !defined( WIN32 )
#   include <sys/types.h>
#   include <unistd.h>
#endif

#include <boost/algorithm/string/predicate.hpp>

#include "logging.hpp"

using namespace std;

namespace sbql {

static Logger logger( "logging" );

namespace detail {

void LogOutputDeleter::operator()( std::ostream const* p )
{
    if ( !Logger::outputFile_.empty()) {
        delete p;
    }
}

ostream& logTimestamp( ostream& os )
{
    auto timestamp { chrono::system_clock::now().time_since_epoch() };
    auto seconds { chrono::duration_cast< chrono::seconds >( timestamp ) };
    auto micros { chrono::duration_cast< chrono::microseconds >( timestamp - seconds ) };
    time_t tt { seconds.count() };
    tm local {};
    localtime_r( &tt, &local );

    return os
            << setw( 4 ) << setfill( '0' ) << ( local.tm_year + 1900 ) << "/"
            << setw( 2 ) << setfill( '0' ) << ( local.tm_mon + 1 ) << "/"
            << setw( 2 ) << setfill( '0' ) << local.tm_mday << " "
            << setw( 2 ) << setfill( '0' ) << local.tm_hour << ":"
            << setw( 2 ) << setfill( '0' ) << local.tm_min << ":"
            << setw( 2 ) << setfill( '0' ) << local.tm_sec << "."
            << setw( 6 ) << setfill( '0' ) << micros.count();
}

ostream& logPid( ostream& os )
{
    return os << setw( 5 ) << setfill( ' ' ) << getpid();
}

template< size_t L >
string logBuildTag( char const* rawTag )
{
    string tag = rawTag;
    if ( tag.length() == L ) {
        return tag;
    }

    string result;
    result.reserve( L );
    if ( tag.length() < L ) {
        result.append( ( L - tag.length() ) / 2, ' ' );
        result.append( tag );
        result.append( ( L - tag.length() ) - ( L - tag.length() ) / 2, ' ' );
    }
    else {
        result.append( "..." );
        result.append( tag.substr( tag.length() - L + 3, L - 3 ) );
    }
    return result;
}

} // namespace detail

Logger::Level const Logger::Level::debug   { "DEBUG", 3 };
Logger::Level const Logger::Level::info    { "INFO ", 2 };
Logger::Level const Logger::Level::warning { "WARN ", 1 };
Logger::Level const Logger::Level::error   { "ERROR", 0 };

Logger::Level const* Logger::Level::parse( string const& name )
{
    using boost::algorithm::iequals;

    if ( iequals( name, "debug" )) {
        return &debug;
    }
    if ( iequals( name, "info" )) {
        return &info;
    }
    if ( iequals( name, "warning" ) || iequals( name, "warn" )) {
        return &warning;
    }
    if ( iequals( name, "error" )) {
        return &error;
    }
    return nullptr;
}

Logger::Level const* Logger::level_ = &Logger::Level::warning;
string Logger::outputFile_;
Logger::OutputPtr Logger::output_;
recursive_mutex Logger::mutex_;

bool Logger::is( Level const& level )
{
    return level_->level >= level.level;
}

void Logger::threshold( Level const& level )
{
    level_ = &level;
}

bool Logger::threshold( string const& name )
{
    auto level = Level::parse( name );
    if ( !level ) {
        logger.warning( "ignoring unknown log level \"", name, "\"" );
        return false;
    }
    threshold( *level );
    return true;
}

void Logger::output( ostream& output )
{
    Lock lock( mutex_ );
    output_.reset();
    outputFile_.clear();
    output_.reset( &output );
}

void Logger::output( string const& outputFile )
{
    Lock lock( mutex_ );
    output_.reset();
    outputFile_ = outputFile;
    output_.reset( new ofstream( outputFile_, ios::out | ios::app ));
}

void Logger::reopen()
{
    if ( outputFile_.empty()) {
        return;
    }

    output( string { outputFile_ } );

    logger.info( "reopening logfile" );
}

Logger::Logger( char const* tag ) noexcept
    : rawTag_( tag )
{
}

void Logger::initialize()
{
    if ( !output_ ) {
        output( cerr );
    }
    if ( tag_.empty()) {
        tag_ = detail::logBuildTag< tagLength >( rawTag_ );
    }
}

} // namespace sbql
