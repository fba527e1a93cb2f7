/**
 * @file bitwriter.cpp
 * @brief BitWriter compilation unit.
 *
 * BitWriter is a template and lives in the header. This unit instantiates
 * it for the bundled sinks so every member is compiled at least once.
 *
 * @see include/bitio/bitwriter.hpp for the full implementation
 */

#include <bitio/bitwriter.hpp>

namespace bitio {

template class BitWriter<VectorSink>;
template class BitWriter<OstreamSink>;
template class BitWriter<ArraySink<64>>;

} // namespace bitio
