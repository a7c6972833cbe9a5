#include "random.hh"

#include <array>
#include <cstdint>

using namespace std;

default_random_engine get_random_engine()
{
  random_device rd;
  array<uint32_t, 4> seed_data {};
  for ( auto& x : seed_data ) {
    x = rd();
  }
  seed_seq seed( seed_data.begin(), seed_data.end() );
  return default_random_engine { seed };
}
