#include "util/util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <thread>
#ifdef _WIN32
#include <sys/types.h>
#include <sys/stat.h>
#else
#include <sys/stat.h>
#endif

#if defined _WIN32 && !defined S_ISDIR
#define S_ISDIR(m) (((m) & _S_IFDIR) == _S_IFDIR)
#endif

namespace POOLMATCH
{

  namespace UTIL
  {

    TimePoint get_current_time()
    {
      return std::chrono::system_clock::now();
    };

    double get_duration(const TimePoint &t1, const TimePoint &t2)
    {
      return std::chrono::duration_cast<
                 std::chrono::milliseconds>(t2 - t1)
                 .count() /
             1000.;
    };

    bool file_exists(const std::string &filename)
    {
#ifdef _WIN32
      struct _stat buf;
      return _stat(filename.c_str(), &buf) != -1;
#else
      struct stat buf;
      return stat(filename.c_str(), &buf) != -1;
#endif
    }

    std::vector<std::string> split_string(const std::string &str, char delim)
    {
      std::vector<std::string> result;
      std::stringstream ss(str);
      std::string intermediate;
      while (getline(ss, intermediate, delim))
      {
        result.push_back(intermediate);
      }
      return result;
    }

    std::string trim(const std::string &str)
    {
      auto not_space = [](unsigned char c)
      { return !std::isspace(c); };
      auto first = std::find_if(str.begin(), str.end(), not_space);
      auto last = std::find_if(str.rbegin(), str.rend(), not_space).base();
      if (first >= last)
        return {};
      return std::string(first, last);
    }

    bool check_file_extension(const std::string &filename,
                              const std::string &extension_list_str)
    {
      std::size_t found = filename.find_last_of('.');
      if (found == std::string::npos)
        return false;
      std::string fn_extension = filename.substr(found + 1);
      std::vector<std::string> extensions = split_string(extension_list_str);
      for (const auto &extension : extensions)
      {
        if (fn_extension == extension)
          return true;
      }
      return false;
    }

    bool folder_exist(const std::string &folder_name)
    {
      if (folder_name.empty())
        return true;
#ifdef _WIN32
      struct _stat sb;
      return _stat(folder_name.c_str(), &sb) == 0 && (sb.st_mode & _S_IFDIR);
#else
      struct stat sb;
      return stat(folder_name.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
#endif
    }

    std::string get_file_directory(const std::string &fn)
    {
      std::size_t found = fn.find_last_of("/");
      if (found != std::string::npos)
      {
        return fn.substr(0, found);
      }
      return {};
    };

    std::istream &safe_get_line(std::istream &is, std::string &t, char delim)
    {
      t.clear();
      std::istream::sentry se(is, true);
      std::streambuf *sb = is.rdbuf();
      for (;;)
      {
        int c = sb->sbumpc();
        switch (c)
        {
        case '\n':
          return is;
        case '\r':
          if (sb->sgetc() == '\n')
            sb->sbumpc();
          return is;
        case std::streambuf::traits_type::eof():
          // Also handle the case when the last line has no line ending
          if (t.empty())
            is.setstate(std::ios::eofbit);
          return is;
        default:
          if (c == delim)
          {
            return is;
          }
          t += (char)c;
        }
      }
    }

    int resolve_concurrency(int requested)
    {
      if (requested > 0)
        return requested;
      unsigned int hw = std::thread::hardware_concurrency();
      return hw == 0 ? 1 : static_cast<int>(hw);
    }

  } // UTIL
} // POOLMATCH
