#pragma once

#include <string>
#include <map>
#include <vector>

// A simple key=value configuration loader. Environment variables named
// PARLEY_<KEY> (upper-cased, '.' replaced by '_') override file values.
class ConfigLoader
{
public:
  // Reads the file and loads key-value pairs.
  bool loadFromFile(const std::string &filename);

  // Same parsing rules as loadFromFile, for in-memory text.
  void loadFromString(const std::string &text);

  void set(const std::string &key, const std::string &value);

  bool has(const std::string &key) const;

  // Get a value as a string.
  std::string getString(const std::string &key, const std::string &defaultValue) const;

  // Getters for other types (int, float, bool).
  int getInt(const std::string &key, int defaultValue) const;
  float getFloat(const std::string &key, float defaultValue) const;
  bool getBool(const std::string &key, bool defaultValue) const;

  // Comma-separated list, entries trimmed, empty entries dropped.
  std::vector<std::string> getList(const std::string &key, const std::string &defaultValue) const;

  // Parses "Name=value,Other=value" into headers. Pairs without '=' or with
  // an empty name are skipped; values may themselves contain '='.
  static std::map<std::string, std::string> parseHeaders(const std::string &spec);

  static std::string envName(const std::string &key);

private:
  std::map<std::string, std::string> data;

  bool lookup(const std::string &key, std::string &out) const;
  void parseLine(const std::string &line);
};

std::string trim(const std::string &s);
