#ifndef SONDE_AGGREGATOR_RESULT_WRITER_HPP
#define SONDE_AGGREGATOR_RESULT_WRITER_HPP

#include <sonde/common/result.hpp>
#include <sonde/common/status.hpp>

namespace sonde {
/** @brief Persists filled results below the output location of a run.
 *
 * write() is called once per filled slot, outside of the aggregator lock but
 * never concurrently. finish() is called once after all threads of the run
 * were joined.
 */
class ResultWriter {
  public:
  virtual ~ResultWriter() = default;

  virtual sonde_status write(const Result& result) = 0;
  virtual sonde_status finish() { return SONDE_OK; }
};
}

#endif
