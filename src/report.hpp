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
@file      report.hpp
@brief     output selected lines with a header and per-source summaries
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef REPORT_HPP
#define REPORT_HPP

#include "config.hpp"
#include "input.hpp"
#include "match.hpp"
#include "output.hpp"
#include <string>

// output the selected lines of a source, then its summary
class Reporter {

 public:

  // report to out, with the header fields colored when color is true
  Reporter(const Config& config, Output& out, bool color);

  // start reporting the lines of the named source
  void begin(const std::string& name);

  // report an evaluated line, output a record when the line is selected with its formatted text
  void report(const Line& line, const MatchResult& result, const std::string& text);

  // output the summary of the source: "Binary file NAME matches" and the number of truncated lines
  void end();

  // the record of a line with the formatted text: filename, separator, line number, separator, text
  std::string record(const Line& line, const std::string& text) const;

  // number of text lines output for the source
  size_t selected() const
  {
    return selected_;
  }

  // number of selected binary lines of the source
  size_t binary_matches() const
  {
    return binary_;
  }

  // number of lines of the source that were truncated
  size_t overflows() const
  {
    return overflow_;
  }

 protected:

  // append a field to the record, colored with SGR parameters sgr
  void field(std::string& record, const std::string& text, const std::string& sgr) const;

  const Config& config_;   // the configuration
  Output&       out_;      // the output
  bool          color_;    // color the header fields
  std::string   name_;     // the name of the source
  size_t        selected_; // number of text lines output
  size_t        binary_;   // number of selected binary lines
  size_t        overflow_; // number of truncated lines

};

#endif
