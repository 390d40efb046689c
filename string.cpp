#include <cctype>
#include <iomanip>

#include "string.hpp"

using namespace std;

namespace sbql {

string urlEncode( string const& value )
{
    ostringstream os;
    os << hex << uppercase << setfill( '0' );
    for ( unsigned char c : value ) {
        if ( isalnum( c ) || c == '-' || c == '_' || c == '.' || c == '~' ) {
            os << c;
        } else {
            os << '%' << setw( 2 ) << static_cast< unsigned >( c );
        }
    }
    return os.str();
}

} // namespace sbql
