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
@file      output.hpp
@brief     Output management
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2020, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef OUTPUT_HPP
#define OUTPUT_HPP

#include "lgrep.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

// output buffering, optionally written by a writer thread in the order produced
class Output {

 public:

  static constexpr size_t SIZE = 16384; // buffered output size to flush

  // bounded FIFO queue of output blocks produced by the search and consumed by the writer thread
  class Queue {

   public:

    explicit Queue(size_t max)
      :
        max_(max > 0 ? max : 1),
        blocks_(),
        mutex_(),
        data_(),
        room_(),
        closed_(false),
        cancelled_(false)
    { }

    // add a block to the queue, wait while the queue is full, returns false if the queue was cancelled
    bool push(std::string&& block)
    {
      std::unique_lock<std::mutex> lock(mutex_);

      while (blocks_.size() >= max_ && !cancelled_)
        room_.wait(lock);

      if (cancelled_)
        return false;

      blocks_.push_back(std::move(block));
      lock.unlock();
      data_.notify_one();

      return true;
    }

    // pop the next block, wait while the queue is empty, returns false when closed and empty or when cancelled
    bool pop(std::string& block)
    {
      std::unique_lock<std::mutex> lock(mutex_);

      while (blocks_.empty() && !closed_ && !cancelled_)
        data_.wait(lock);

      if (cancelled_ || blocks_.empty())
        return false;

      block = std::move(blocks_.front());
      blocks_.pop_front();
      lock.unlock();
      room_.notify_one();

      return true;
    }

    // no more blocks will be pushed
    void close()
    {
      std::unique_lock<std::mutex> lock(mutex_);
      closed_ = true;
      lock.unlock();
      data_.notify_all();
    }

    // discard queued blocks and wake up the producer and the consumer
    void cancel()
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cancelled_ = true;
      blocks_.clear();
      lock.unlock();
      data_.notify_all();
      room_.notify_all();
    }

    // true if cancelled
    bool cancelled()
    {
      std::unique_lock<std::mutex> lock(mutex_);
      return cancelled_;
    }

    // the number of blocks queued
    size_t size()
    {
      std::unique_lock<std::mutex> lock(mutex_);
      return blocks_.size();
    }

   protected:

    size_t                  max_;       // max number of blocks queued
    std::deque<std::string> blocks_;    // queued blocks
    std::mutex              mutex_;     // mutex to access the queue
    std::condition_variable data_;      // a block was queued or the queue was closed or cancelled
    std::condition_variable room_;      // a block was popped or the queue was cancelled
    bool                    closed_;    // no more blocks will be pushed
    bool                    cancelled_; // output failed

  };

  // output to file, with a writer thread when pipeline is true that queues at most max_queue blocks
  Output(FILE *file, bool pipeline = false, size_t max_queue = DEFAULT_MAX_QUEUE);

  // destructor flushes and joins the writer thread
  ~Output()
  {
    finish();
  }

  // output a character c
  void chr(int c)
  {
    buf_.push_back(static_cast<char>(c));
  }

  // output a string s
  void str(const std::string& s)
  {
    buf_.append(s);
  }

  // output a newline and end the record, flush if --line-buffered or when the buffer is full
  void nl()
  {
    chr('\n');
    check_flush();
  }

  // enable line buffered mode to flush each line to output
  void set_flush()
  {
    flush_ = true;
  }

  // flush if output is line buffered or the buffer is full
  void check_flush()
  {
    if (flush_ || buf_.size() >= SIZE)
      flush();
  }

  // flush the buffered output to the writer thread or to the file
  void flush();

  // flush and wait for the writer thread to write all output
  void finish();

  // cancel output
  void cancel()
  {
    eof = true;
    queue_.cancel();
  }

  // true if the writer thread is used
  bool pipelined() const
  {
    return thread_.joinable();
  }

  FILE            *file; // output stream
  std::atomic_bool eof;  // the other end closed or has an error

 protected:

  // write data to the file, cancel output on error
  void write(const std::string& data);

  // the writer thread writes the queued blocks
  void writer();

  std::string buf_;    // buffered output of records not yet flushed
  bool        flush_;  // --line-buffered
  Queue       queue_;  // blocks to write by the writer thread
  std::thread thread_; // the writer thread, when pipelined

};

#endif
