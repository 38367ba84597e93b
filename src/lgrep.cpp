/******************************************************************************\
* Copyright (c) 2019, Robert van Engelen, Genivia Inc. All rights reserved.    *
*                                                                              *
* Redistribution and use in source and binary forms, with or without           *
* modification, are permitted provided that the following conditions are met:  *
*                                                                              *
*   (1) Redistributions of source code must retain the above copyright notice, *
*       this list of conditions and the following disclaimer.                  *
*                                                                              *
*   (2) Redistributions in binary form must reproduce the above copyright      *
*       notice, this list of conditions and the following disclaimer in the    *
*       documentation and/or other materials provided with the distribution.   *
*                                                                              *
*   (3) The name of the author may not be used to endorse or promote products  *
*       derived from this software without specific prior written permission.  *
*                                                                              *
* THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR IMPLIED *
* WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF         *
* MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO   *
* EVENT SHALL THE AUTHOR BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,       *
* SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, *
* PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;  *
* OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,     *
* WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR      *
* OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF       *
* ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.                                   *
\******************************************************************************/

/**
@file      lgrep.cpp
@brief     lgrep command-line options, configuration and main
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

Usage: lgrep [OPTIONS] [PATTERN] [-f FILE] [-e PATTERN] [FILE ...]

Search the FILEs, or standard input, for lines matching the PATTERNs and
output the lines with the matches highlighted when output is a color terminal.
*/

#include "lgrep.hpp"
#include "config.hpp"
#include "grep.hpp"
#include "input.hpp"
#include "output.hpp"
#include "pattern.hpp"
#include "stats.hpp"
#include <reflex/error.h>
#include <csignal>
#include <iostream>
#include <list>
#include <string>
#include <vector>

// the search configuration, complete when init() returns
static Config config;

// -e PATTERN and PATTERN arguments
static std::vector<std::string> arg_patterns;

// -f FILE arguments
static std::vector<std::string> arg_pattern_files;

// the positional PATTERN argument, when no -e and no -f are specified
static const char *arg_pattern = NULL;

// FILE arguments
static std::vector<std::string> arg_files;

// saved string arguments parsed from a config file
static std::list<std::string> arg_strings;

// --colors=COLORS
static const char *flag_colors = NULL;

// --config[=FILE]
static const char *flag_config = NULL;

// --stats
static bool flag_stats = false;

// do not exit on usage errors in a config file, count them instead
static bool flag_usage_warnings = false;
static size_t usage_warnings = 0;

static void init(int argc, const char **argv);
static void options(int argc, const char **argv);
static void load_config(bool recurse = false);
static void terminal();
static void split_patterns(const char *patterns, std::vector<std::string>& split);
static void read_patterns(const char *pathname, std::vector<std::string>& patterns);
static void trim(std::string& line);
static const char *getoptarg(int argc, const char **argv, const char *arg, int& i);
static const char *getloptarg(int argc, const char **argv, const char *arg, int& i);
static const char *strarg(const char *string);
static size_t strtonum(const char *string, const char *message);
static size_t strtopos(const char *string, const char *message);
static void usage(const char *message, const char *arg = NULL, const char *valid = NULL);
static void help();
static void version();

// lgrep main()
int main(int argc, const char **argv)
{
#ifndef OS_WIN

  // ignore SIGPIPE, a closed output pipe is detected as a write error
  signal(SIGPIPE, SIG_IGN);

#endif

  try
  {
    init(argc, argv);
  }

  catch (std::exception& error)
  {
    abort("error: ", error.what());
  }

  std::vector<std::string> patterns;

  // -e PATTERN and -f FILE, or else the PATTERN argument
  for (const auto& pattern : arg_patterns)
    split_patterns(pattern.c_str(), patterns);

  for (const auto& file : arg_pattern_files)
    read_patterns(file.c_str(), patterns);

  if (arg_patterns.empty() && arg_pattern_files.empty() && arg_pattern != NULL)
    split_patterns(arg_pattern, patterns);

  if (patterns.empty())
    usage("no PATTERN specified: specify -e PATTERN or -f FILE");

  Patterns compiled;

  try
  {
    compiled = compile(patterns, config);
  }

  catch (PatternError& error)
  {
    abort("error: ", error.what());
  }

  Stats::reset();

  try
  {
    Output out(stdout, config.pipeline, config.max_queue);

    if (config.line_buffered)
      out.set_flush();

    Grep grep(config, compiled, out);

    grep.grep(arg_files);

    out.finish();
  }

  catch (reflex::regex_error& error)
  {
    abort("error: ", error.what());
  }

  catch (std::exception& error)
  {
    abort("error: ", error.what());
  }

  if (flag_stats)
    Stats::report(stdout);

  return EXIT_OK;
}

// parse the command line, the config file and GREP_COLORS, then set up the configuration
static void init(int argc, const char **argv)
{
  // --config[=FILE] is loaded first, options on the command line override
  for (int i = 1; i < argc; ++i)
  {
    if (strcmp(argv[i], "--") == 0)
      break;

    if (strncmp(argv[i], "--config", 8) == 0 && (argv[i][8] == '\0' || argv[i][8] == '='))
    {
      flag_config = argv[i][8] == '=' ? argv[i] + 9 : "";
      load_config();
    }
  }

  options(argc, argv);

  // the palette is GREP_COLORS over the default colors, then --colors over both
  char *grep_colors = NULL;
  if (dupenv_s(&grep_colors, "GREP_COLORS") == 0 && grep_colors != NULL)
  {
    config.palette.parse(grep_colors);
    free(grep_colors);
  }

  if (flag_colors != NULL)
    config.palette.parse(flag_colors);

  terminal();
}

// parse the command-line options
static void options(int argc, const char **argv)
{
  bool options = true;

  for (int i = 1; i < argc; ++i)
  {
    const char *arg = argv[i];

    if (*arg == '-' && arg[1] != '\0' && options)
    {
      bool is_grouped = true;

      // parse an lgrep command-line option
      while (is_grouped && *++arg != '\0')
      {
        switch (*arg)
        {
          case '-':
            is_grouped = false;
            if (*++arg == '\0')
            {
              options = false;
              continue;
            }

            switch (*arg)
            {
              case 'b':
                if (strcmp(arg, "basic-regexp") == 0)
                  config.dialect = Dialect::BASIC;
                else
                  usage("invalid option --", arg, "--basic-regexp");
                break;

              case 'c':
                if (strcmp(arg, "color") == 0 || strcmp(arg, "colour") == 0)
                  config.color_mode = ColorMode::AUTO;
                else if (strncmp(arg, "color=", 6) == 0 || strncmp(arg, "colour=", 7) == 0)
                {
                  const char *when = strchr(arg, '=') + 1;
                  if (!color_mode(when, config.color_mode))
                    usage("invalid argument --color=WHEN, valid arguments are 'never', 'always' and 'auto'");
                }
                else if (strncmp(arg, "colors=", 7) == 0 || strncmp(arg, "colours=", 8) == 0)
                  flag_colors = strarg(strchr(arg, '=') + 1);
                else if (strcmp(arg, "config") == 0 || strncmp(arg, "config=", 7) == 0)
                  ; // loaded before parsing the options
                else
                  usage("invalid option --", arg, "--color, --colors= or --config");
                break;

              case 'd':
                if (strncmp(arg, "delimiter=", 10) == 0)
                {
                  std::string delimiter = unescape(arg + 10);
                  if (delimiter.empty())
                    usage("invalid argument --delimiter=, the delimiter must not be empty");
                  else
                    config.delimiter.swap(delimiter);
                }
                else
                {
                  usage("invalid option --", arg, "--delimiter=");
                }
                break;

              case 'e':
                if (strcmp(arg, "extended-regexp") == 0)
                  config.dialect = Dialect::EXTENDED;
                else
                  usage("invalid option --", arg, "--extended-regexp");
                break;

              case 'f':
                if (strcmp(arg, "fixed-strings") == 0)
                  config.dialect = Dialect::FIXED;
                else if (strcmp(arg, "file") == 0 || strncmp(arg, "file=", 5) == 0)
                  arg_pattern_files.emplace_back(getloptarg(argc, argv, arg[4] == '=' ? arg + 5 : "", i));
                else
                  usage("invalid option --", arg, "--file= or --fixed-strings");
                break;

              case 'h':
                if (strcmp(arg, "help") == 0)
                  help();
                else
                  usage("invalid option --", arg, "--help");
                break;

              case 'i':
                if (strcmp(arg, "ignore-case") == 0)
                  config.ignore_case = true;
                else if (strcmp(arg, "invert-match") == 0)
                  config.invert = true;
                else
                  usage("invalid option --", arg, "--ignore-case or --invert-match");
                break;

              case 'l':
                if (strcmp(arg, "line-buffered") == 0)
                  config.line_buffered = true;
                else if (strcmp(arg, "line-number") == 0)
                  config.line_number = true;
                else if (strcmp(arg, "line-regexp") == 0)
                  config.line_anchor = true;
                else
                  usage("invalid option --", arg, "--line-buffered, --line-number or --line-regexp");
                break;

              case 'm':
                if (strncmp(arg, "max-line=", 9) == 0)
                  config.max_line = strtopos(arg + 9, "invalid argument --max-line=");
                else if (strncmp(arg, "max-queue=", 10) == 0)
                  config.max_queue = strtopos(arg + 10, "invalid argument --max-queue=");
                else
                  usage("invalid option --", arg, "--max-line= or --max-queue=");
                break;

              case 'n':
                if (strncmp(arg, "name-num-sep=", 13) == 0)
                  config.name_number_separator.assign(arg + 13);
                else if (strcmp(arg, "no-filename") == 0)
                  config.with_filename = false;
                else if (strcmp(arg, "no-ignore-case") == 0)
                  config.ignore_case = false;
                else if (strcmp(arg, "no-messages") == 0)
                  config.no_messages = true;
                else if (strcmp(arg, "no-pipeline") == 0)
                  config.pipeline = false;
                else if (strcmp(arg, "null-data") == 0)
                  config.delimiter.assign(1, '\0');
                else
                  usage("invalid option --", arg, "--name-num-sep=, --no-filename, --no-ignore-case, --no-messages, --no-pipeline or --null-data");
                break;

              case 'r':
                if (strcmp(arg, "regexp") == 0 || strncmp(arg, "regexp=", 7) == 0)
                  arg_patterns.emplace_back(getloptarg(argc, argv, arg[6] == '=' ? arg + 7 : "", i));
                else if (strncmp(arg, "result-sep=", 11) == 0)
                  config.result_separator.assign(arg + 11);
                else
                  usage("invalid option --", arg, "--regexp= or --result-sep=");
                break;

              case 's':
                if (strncmp(arg, "separator=", 10) == 0)
                {
                  config.result_separator.assign(arg + 10);
                  config.name_number_separator.assign(arg + 10);
                }
                else if (strcmp(arg, "stats") == 0)
                  flag_stats = true;
                else
                  usage("invalid option --", arg, "--separator= or --stats");
                break;

              case 'v':
                if (strcmp(arg, "version") == 0)
                  version();
                else
                  usage("invalid option --", arg, "--version");
                break;

              case 'w':
                if (strcmp(arg, "with-filename") == 0)
                  config.with_filename = true;
                else if (strcmp(arg, "word-regexp") == 0)
                  config.word_anchor = true;
                else
                  usage("invalid option --", arg, "--with-filename or --word-regexp");
                break;

              default:
                usage("invalid option --", arg);
            }
            break;

          case 'E':
            config.dialect = Dialect::EXTENDED;
            break;

          case 'e':
            arg_patterns.emplace_back(getoptarg(argc, argv, arg, i));
            is_grouped = false;
            break;

          case 'F':
            config.dialect = Dialect::FIXED;
            break;

          case 'f':
            arg_pattern_files.emplace_back(getoptarg(argc, argv, arg, i));
            is_grouped = false;
            break;

          case 'G':
            config.dialect = Dialect::BASIC;
            break;

          case 'H':
            config.with_filename = true;
            break;

          case 'i':
            config.ignore_case = true;
            break;

          case 'n':
            config.line_number = true;
            break;

          case 's':
            config.no_messages = true;
            break;

          case 'V':
            version();
            break;

          case 'v':
            config.invert = true;
            break;

          case 'w':
            config.word_anchor = true;
            break;

          case 'x':
            config.line_anchor = true;
            break;

          case 'z':
            config.delimiter.assign(1, '\0');
            break;

          default:
          {
            std::string option(arg, 1);
            usage("invalid option -", option.c_str(), "--help");
          }
        }
      }
    }
    else if (arg_pattern == NULL && arg_patterns.empty() && arg_pattern_files.empty() && argv[0] != NULL)
    {
      // the first argument is the PATTERN when no -e and no -f options precede it
      arg_pattern = arg;
    }
    else if (argv[0] != NULL)
    {
      arg_files.emplace_back(arg);
    }
    else
    {
      usage("invalid argument in the configuration file, expected an option: ", arg);
    }
  }

  // a PATTERN argument is a FILE when -e or -f is specified after it
  if (arg_pattern != NULL && (!arg_patterns.empty() || !arg_pattern_files.empty()))
  {
    arg_files.insert(arg_files.begin(), arg_pattern);
    arg_pattern = NULL;
  }
}

// load the config file specified or the default .lgrep, located in the working directory or home directory
static void load_config(bool recurse)
{
  // the default config file is .lgrep when FILE is not specified
  if (flag_config == NULL || *flag_config == '\0')
    flag_config = DEFAULT_CONFIG_FILE;

  std::string config_file(flag_config);

  LineSource source;

  if (source.open(config_file.c_str()) != 0)
  {
    char *home_dir = NULL;

    // check the home directory for the configuration file
    if (*flag_config != '/' && dupenv_s(&home_dir, "HOME") == 0 && home_dir != NULL)
    {
      config_file.assign(home_dir).append("/").append(flag_config);
      free(home_dir);

      if (source.open(config_file.c_str()) != 0)
        config_file.clear();
    }
    else
    {
      config_file.clear();
    }
  }

  if (config_file.empty())
  {
    if (strcmp(flag_config, DEFAULT_CONFIG_FILE) != 0)
      error("option --config: cannot read", flag_config);
    return;
  }

  Line line;
  bool errors = false;

  while (source.next(line))
  {
    std::string text(line.text);

    trim(text);

    // parse option or skip empty lines and comments
    if (!text.empty() && text.front() != '#')
    {
      // construct an option argument to parse as argv[]
      text.insert(0, "--");
      const char *arg = strarg(text.c_str());
      const char *args[2] = { NULL, arg };

      usage_warnings = 0;

      // warn about invalid options but do not exit
      flag_usage_warnings = true;

      if (strncmp(arg, "--config", 8) == 0 && (arg[8] == '\0' || arg[8] == '='))
      {
        // include a config file, but do not recurse more than one level deep
        if (recurse)
        {
          std::cerr << "lgrep: recursive configuration in " << config_file << " at line " << line.lineno << '\n';
          errors = true;
        }
        else
        {
          const char *this_config = flag_config;
          flag_config = arg[8] == '=' ? arg + 9 : "";
          load_config(true);
          flag_config = this_config;
        }
      }
      else
      {
        options(2, args);

        if (usage_warnings > 0)
        {
          std::cerr << "lgrep: error in " << config_file << " at line " << line.lineno << '\n';
          errors = true;
        }
      }

      flag_usage_warnings = false;
    }
  }

  if (source.error())
    error("error while reading", config_file.c_str());

  if (errors)
    exit(EXIT_ERROR);
}

// color the warning and error messages when standard error is a color terminal
static void terminal()
{
  bool color = false;

  if (config.color_mode != ColorMode::NEVER && isatty(STDERR_FILENO) != 0)
  {
    char *term = NULL;
    color = dupenv_s(&term, "TERM") == 0 && term != NULL && strcmp(term, "dumb") != 0;
    if (term != NULL)
      free(term);
  }

  message_colors(color);
}

// split patterns at \r\n and \n into separate patterns
static void split_patterns(const char *patterns, std::vector<std::string>& split)
{
  const char *from = patterns;
  const char *to;

  while ((to = strchr(from, '\n')) != NULL)
  {
    const char *end = to;
    if (end > from && end[-1] == '\r')
      --end;
    split.emplace_back(from, end - from);
    from = to + 1;
  }

  split.emplace_back(from);
}

// read the patterns of a -f FILE, one per line, or from standard input when FILE is -
static void read_patterns(const char *pathname, std::vector<std::string>& patterns)
{
  LineSource source;

  errno = source.open(pathname);

  if (errno != 0)
    error("option -f: cannot read", pathname);

  Line line;

  while (source.next(line))
    patterns.push_back(line.text);

  if (source.error())
    error("option -f: error while reading", pathname);
}

// trim white space from either end of the line
static void trim(std::string& line)
{
  size_t len = line.length();
  size_t pos;

  for (pos = 0; pos < len && isspace(static_cast<unsigned char>(line.at(pos))); ++pos)
    continue;

  if (pos > 0)
    line.erase(0, pos);

  len -= pos;

  for (pos = len; pos > 0 && isspace(static_cast<unsigned char>(line.at(pos - 1))); --pos)
    continue;

  if (len > pos)
    line.erase(pos, len - pos);
}

// get short option argument
static const char *getoptarg(int argc, const char **argv, const char *arg, int& i)
{
  if (*++arg == '=')
    ++arg;
  if (*arg != '\0')
    return arg;
  if (++i < argc && argv[i] != NULL)
    return argv[i];
  usage("missing argument for option -", arg - 1);
  return "";
}

// get required non-empty long option argument after =, or the next argument
static const char *getloptarg(int argc, const char **argv, const char *arg, int& i)
{
  if (*arg != '\0')
    return arg;
  if (++i < argc && argv[i] != NULL)
    return argv[i];
  usage("missing argument for option ", argv[i - 1]);
  return "";
}

// save a string argument parsed from the command line or from a config file
static const char *strarg(const char *string)
{
  arg_strings.emplace_back(string);
  return arg_strings.back().c_str();
}

// convert unsigned decimal to non-negative size_t, produce error when conversion fails
static size_t strtonum(const char *string, const char *message)
{
  char *rest = NULL;
  size_t size = static_cast<size_t>(strtoull(string, &rest, 10));
  if (rest == NULL || rest == string || *rest != '\0')
    usage(message, string);
  return size;
}

// convert unsigned decimal to positive size_t, produce error when conversion fails or when the value is zero
static size_t strtopos(const char *string, const char *message)
{
  size_t size = strtonum(string, message);
  if (size == 0)
    usage(message, string);
  return size;
}

// print a diagnostic message
static void usage(const char *message, const char *arg, const char *valid)
{
  std::cerr << "lgrep: " << message << (arg != NULL ? arg : "");
  if (valid != NULL)
    std::cerr << ", did you mean " << valid << "?";
  std::cerr << std::endl;
  std::cerr << "For more help on options, try `lgrep --help'" << std::endl;

  // do not exit when reading a config file
  if (!flag_usage_warnings)
    exit(EXIT_ERROR);

  ++usage_warnings;
}

// print usage/help information and exit
static void help()
{
  std::cout <<
    "Usage: lgrep [OPTIONS] [PATTERN] [-f FILE] [-e PATTERN] [FILE ...]\n\n\
    -E, --extended-regexp\n\
            Interpret patterns as extended regular expressions (EREs).\n\
    -e PATTERN, --regexp=PATTERN\n\
            Specify a PATTERN to search.  This option may be repeated.  A\n\
            PATTERN with newlines specifies multiple patterns.\n\
    -F, --fixed-strings\n\
            Interpret patterns as fixed strings.\n\
    -f FILE, --file=FILE\n\
            Read patterns from FILE, one per line.  When FILE is `-', read\n\
            the patterns from standard input.\n\
    -G, --basic-regexp\n\
            Interpret patterns as basic regular expressions (BREs), the default.\n\
    -H, --with-filename\n\
            Output the file name of each matching line.\n\
    --no-filename\n\
            Do not output file names, the default.\n\
    -i, --ignore-case\n\
            Ignore case in patterns and lines.\n\
    --no-ignore-case\n\
            Do not ignore case, the default.\n\
    -n, --line-number\n\
            Output the line number of each matching line.\n\
    -s, --no-messages\n\
            Silent mode: do not report unreadable files.\n\
    -V, --version\n\
            Display version information and exit.\n\
    -v, --invert-match\n\
            Select lines that do not match.  Selected lines are not colored.\n\
    -w, --word-regexp\n\
            Match patterns as whole words.\n\
    -x, --line-regexp\n\
            Match patterns against whole lines.\n\
    -z, --null-data\n\
            Lines are terminated by a NUL byte.\n\
    --color[=WHEN], --colour[=WHEN]\n\
            Color the output when WHEN is `always', or when WHEN is `auto' and\n\
            output is a color terminal.  WHEN is `never', `always' or `auto'.\n\
    --colors=COLORS, --colours=COLORS\n\
            Use COLORS to override GREP_COLORS, e.g. --colors='ms=1;32:fn=m'.\n\
            The parameters are ms, mc, mt, fn, ln and se.  Default colors are\n\
            " DEFAULT_GREP_COLORS "\n\
    --config[=FILE]\n\
            Use the options in FILE, one long option per line without `--'.\n\
            The default FILE is `" DEFAULT_CONFIG_FILE "' in the working or home directory.\n\
    --delimiter=BYTES\n\
            Lines are terminated by BYTES, with escapes \\n, \\r, \\t, \\0, \\\\\n\
            and \\xHH.  The default is \\n, a \\r before a \\n is removed.\n\
    --line-buffered\n\
            Flush the output after each line.\n\
    --max-line=NUM\n\
            Retain at most NUM bytes of a line, longer lines are truncated and\n\
            reported per file.  The default is " << DEFAULT_MAX_LINE << ".\n\
    --max-queue=NUM\n\
            Queue at most NUM output blocks for the output thread.  The\n\
            default is " << DEFAULT_MAX_QUEUE << ".\n\
    --name-num-sep=SEP\n\
            Use SEP between the file name and the line number, default `:'.\n\
    --no-pipeline\n\
            Write output in the searching thread instead of an output thread.\n\
    --result-sep=SEP\n\
            Use SEP before the matching line, default `:'.\n\
    --separator=SEP\n\
            Use SEP for --name-num-sep and --result-sep.\n\
    --stats\n\
            Output statistics on the lines searched and selected.\n\
    --help\n\
            Display this help and exit.\n\
\n\
    The exit status is 0 when the search completed and 2 when no PATTERN is\n\
    specified, a PATTERN is invalid or an option is invalid.\n\
\n";

  exit(EXIT_OK);
}

// print version info and exit
static void version()
{
  std::cout << "lgrep " LGREP_VERSION "\n"
    "License: BSD-3-Clause\n"
    "lgrep utilizes the RE/flex regex library: <https://github.com/Genivia/RE-flex>" << std::endl;
  exit(EXIT_OK);
}
