#include "configLoader.hpp"
#include "AppLogger.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

// Helper function to trim whitespace from both ends of a string
std::string trim(const std::string &s)
{
  const std::string WHITESPACE = " \t\n\r\f\v";
  size_t first = s.find_first_not_of(WHITESPACE);
  if (std::string::npos == first)
  {
    return "";
  }
  size_t last = s.find_last_not_of(WHITESPACE);
  return s.substr(first, (last - first + 1));
}

bool ConfigLoader::loadFromFile(const std::string &filename)
{
  data.clear();
  std::ifstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "Error: Could not open configuration file: " << filename << std::endl;
    return false;
  }

  std::string line;
  while (std::getline(file, line))
  {
    parseLine(line);
  }
  return true;
}

void ConfigLoader::loadFromString(const std::string &text)
{
  data.clear();
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line))
  {
    parseLine(line);
  }
}

void ConfigLoader::parseLine(const std::string &raw)
{
  std::string line = trim(raw);
  if (line.empty() || line[0] == '#')
  {
    return;
  }

  size_t delimiter_pos = line.find('=');
  if (delimiter_pos != std::string::npos)
  {
    std::string key = line.substr(0, delimiter_pos);
    std::string value = line.substr(delimiter_pos + 1);

    data[trim(key)] = trim(value);
  }
}

void ConfigLoader::set(const std::string &key, const std::string &value)
{
  data[key] = value;
}

std::string ConfigLoader::envName(const std::string &key)
{
  std::string name = "PARLEY_";
  for (char c : key)
  {
    name += (c == '.') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return name;
}

bool ConfigLoader::lookup(const std::string &key, std::string &out) const
{
  const char *env = std::getenv(envName(key).c_str());
  if (env != nullptr)
  {
    out = env;
    return true;
  }
  auto it = data.find(key);
  if (it != data.end())
  {
    out = it->second;
    return true;
  }
  return false;
}

bool ConfigLoader::has(const std::string &key) const
{
  std::string ignored;
  return lookup(key, ignored);
}

std::string ConfigLoader::getString(const std::string &key, const std::string &defaultValue) const
{
  std::string value;
  return lookup(key, value) ? value : defaultValue;
}

int ConfigLoader::getInt(const std::string &key, int defaultValue) const
{
  std::string value;
  if (lookup(key, value))
  {
    try
    {
      return std::stoi(value);
    }
    catch (const std::exception &)
    {
      AppLogger::getInstance().warn("config: '" + key + "' is not an integer (" + value + "), using default");
    }
  }
  return defaultValue;
}

float ConfigLoader::getFloat(const std::string &key, float defaultValue) const
{
  std::string value;
  if (lookup(key, value))
  {
    try
    {
      return std::stof(value);
    }
    catch (const std::exception &)
    {
      AppLogger::getInstance().warn("config: '" + key + "' is not a number (" + value + "), using default");
    }
  }
  return defaultValue;
}

bool ConfigLoader::getBool(const std::string &key, bool defaultValue) const
{
  std::string val;
  if (lookup(key, val))
  {
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "true" || val == "1" || val == "yes")
      return true;
    if (val == "false" || val == "0" || val == "no")
      return false;
  }
  return defaultValue;
}

std::vector<std::string> ConfigLoader::getList(const std::string &key, const std::string &defaultValue) const
{
  std::vector<std::string> items;
  std::istringstream in(getString(key, defaultValue));
  std::string item;
  while (std::getline(in, item, ','))
  {
    item = trim(item);
    if (!item.empty())
    {
      items.push_back(item);
    }
  }
  return items;
}

std::map<std::string, std::string> ConfigLoader::parseHeaders(const std::string &spec)
{
  std::map<std::string, std::string> headers;
  std::istringstream in(spec);
  std::string pair;
  while (std::getline(in, pair, ','))
  {
    size_t eq = pair.find('=');
    if (eq == std::string::npos)
    {
      continue;
    }
    std::string name = trim(pair.substr(0, eq));
    if (name.empty())
    {
      continue;
    }
    headers[name] = trim(pair.substr(eq + 1));
  }
  return headers;
}
