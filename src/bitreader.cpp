/**
 * @file bitreader.cpp
 * @brief BitReader compilation unit.
 *
 * BitReader is a template and lives in the header. This unit instantiates
 * it for the bundled sources so every member is compiled at least once.
 *
 * @see include/bitio/bitreader.hpp for the full implementation
 */

#include <bitio/bitreader.hpp>

namespace bitio {

template class BitReader<MemorySource>;
template class BitReader<IstreamSource>;

} // namespace bitio
