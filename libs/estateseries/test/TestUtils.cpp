#include "TestUtils.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>      // for mkstemp() and close()

using namespace estatetrend;

boost::gregorian::date createDate(const std::string& isoDate)
{
  return boost::gregorian::from_simple_string(isoDate);
}

SaleRecord createSale(const std::string& isoDate,
		      long price,
		      const std::string& unit,
		      const std::string& building,
		      const std::string& estate)
{
  return SaleRecord(createDate(isoDate), price, PropertyKey(unit, building), estate);
}

ReferenceRecord createReference(const std::string& region,
				const std::string& isoMonth,
				long averageAll,
				long averageFlats)
{
  return ReferenceRecord(region, createDate(isoMonth), averageAll, averageFlats, 100.0, 100.0);
}

ReferenceIndex createReferenceIndex(const std::string& region,
				    const std::vector<std::pair<std::string, long>>& flatsByMonth)
{
  ReferenceIndex index(region);

  for (const auto& [isoMonth, flats] : flatsByMonth)
    index.addRecord(createReference(region, isoMonth, flats * 2, flats));

  return index;
}

std::string createTemporaryFileName()
{
  char tmpl[] = "/tmp/estatetrend-XXXXXX";
  int fd = mkstemp(tmpl);
  if (fd < 0)
    throw std::runtime_error("mkstemp failed");
  ::close(fd);
  std::remove(tmpl);
  return std::string(tmpl);
}

std::string writeTemporaryFile(const std::string& content)
{
  char tmpl[] = "/tmp/estatetrend-XXXXXX";
  int fd = mkstemp(tmpl);
  if (fd < 0)
    throw std::runtime_error("mkstemp failed");
  ::close(fd);

  std::ofstream out(tmpl);
  out << content;
  return std::string(tmpl);
}

std::string readFileContents(const std::string& fileName)
{
  std::ifstream in(fileName);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::vector<std::string> readLines(const std::string& fileName)
{
  std::ifstream in(fileName);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line))
    {
      if (line.empty()) continue;
      lines.push_back(line);
    }
  return lines;
}

std::vector<std::string> split(const std::string& s, char delim)
{
  std::vector<std::string> elems;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    elems.push_back(item);
  }
  // getline drops a trailing empty field
  if (!s.empty() && s.back() == delim)
    elems.push_back(std::string());
  return elems;
}
