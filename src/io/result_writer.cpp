#include "io/result_writer.hpp"
#include "util/debug.hpp"

#include <iomanip>
#include <stdexcept>

#include <boost/format.hpp>

using namespace POOLMATCH;
using namespace POOLMATCH::IO;
using namespace POOLMATCH::MATCH;

CSVMatchResultWriter::CSVMatchResultWriter(const std::string &filename)
    : m_fstream(filename)
{
  if (!m_fstream.is_open())
  {
    throw std::runtime_error(
        (boost::format("Cannot open output file %1%") % filename).str());
  }
  SPDLOG_DEBUG("Write match results to {}", filename);
  write_header();
}

void CSVMatchResultWriter::write_header()
{
  m_fstream << "for_trip_id;rank;trip_id;score;overlap;start;end;time\n";
}

void CSVMatchResultWriter::write_result(const MatchResult &result)
{
  m_fstream << std::fixed << std::setprecision(6);
  for (std::size_t i = 0; i < result.candidates.size(); ++i)
  {
    const MatchCandidate &c = result.candidates[i];
    m_fstream << result.for_trip_id << ';' << (i + 1) << ';' << c.trip_id << ';'
              << c.score << ';' << c.overlap_fraction << ';'
              << c.start_proximity << ';' << c.end_proximity << ';'
              << c.time_delta << '\n';
    ++num_lines;
  }
  m_fstream.flush();
}
