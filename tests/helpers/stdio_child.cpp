//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: stdio_child.cpp
// Purpose: Scripted stdio server used by the executor and HTTP tests. The first argument picks the
//          behavior; everything after it is mode-specific.
//
//   echo                  read one line, write it back
//   env NAME              read one line, write the value of NAME (empty when unset)
//   args                  read one line, write the remaining arguments joined by '|'
//   stderr-flood BYTES    write BYTES to stderr before reading stdin, then echo
//   sleep MS              sleep MS milliseconds, then echo
//   exit CODE             read one line, write a diagnostic to stderr, exit with CODE
//   flood-exit BYTES      write BYTES to stderr, read one line, exit with 1
//   multiline             read one line, write "first" and "second" on separate lines
//   crlf                  read one line, write it back terminated by "\r\n"
//   partial               read one line, write "partial" without a newline
//   pidfile PATH          write the process id to PATH, then sleep 10 s
//   no-read CODE          exit immediately with CODE without touching stdin
//   long-line BYTES       read one line, write a line of BYTES 'x' characters
//   orphan-stderr PATH CODE
//                         fork a process that keeps stderr open for 20 s and write its id to PATH,
//                         then read one line, echo it, write a note to stderr and exit with CODE
//==========================================================================================================

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

namespace {

std::string readLine() {
    std::string line;
    std::getline(std::cin, line);
    return line;
}

int toInt(const char* s) {
    return s != nullptr ? std::atoi(s) : 0;
}

void floodStderr(long bytes) {
    const std::string chunk(4096, 'e');
    while (bytes > 0) {
        const long n = bytes < static_cast<long>(chunk.size()) ? bytes : static_cast<long>(chunk.size());
        std::cerr.write(chunk.data(), n);
        bytes -= n;
    }
    std::cerr.flush();
}

} // namespace

int main(int argc, char** argv) {
    const std::string mode = argc > 1 ? argv[1] : "echo";
    const char* param = argc > 2 ? argv[2] : nullptr;

    if (mode == "echo") {
        std::cout << readLine() << "\n" << std::flush;
        return 0;
    }
    if (mode == "env") {
        readLine();
        const char* v = param != nullptr ? std::getenv(param) : nullptr;
        std::cout << (v != nullptr ? v : "") << "\n" << std::flush;
        return 0;
    }
    if (mode == "args") {
        readLine();
        std::string joined;
        for (int i = 2; i < argc; ++i) {
            if (i > 2) { joined += "|"; }
            joined += argv[i];
        }
        std::cout << joined << "\n" << std::flush;
        return 0;
    }
    if (mode == "stderr-flood" || mode == "flood-exit") {
        floodStderr(toInt(param));
        const std::string line = readLine();
        if (mode == "flood-exit") {
            return 1;
        }
        std::cout << line << "\n" << std::flush;
        return 0;
    }
    if (mode == "sleep") {
        std::this_thread::sleep_for(std::chrono::milliseconds(toInt(param)));
        std::cout << readLine() << "\n" << std::flush;
        return 0;
    }
    if (mode == "exit") {
        readLine();
        std::cerr << "child failing on purpose" << std::endl;
        return toInt(param);
    }
    if (mode == "multiline") {
        readLine();
        std::cout << "first\nsecond\n" << std::flush;
        return 0;
    }
    if (mode == "crlf") {
        std::cout << readLine() << "\r\n" << std::flush;
        return 0;
    }
    if (mode == "partial") {
        readLine();
        std::cout << "partial" << std::flush;
        return 0;
    }
    if (mode == "pidfile") {
        {
            std::ofstream out(param != nullptr ? param : "stdio_child.pid");
            out << ::getpid() << "\n";
        }
        std::this_thread::sleep_for(std::chrono::seconds(10));
        return 0;
    }
    if (mode == "no-read") {
        return toInt(param);
    }
    if (mode == "long-line") {
        readLine();
        std::cout << std::string(static_cast<std::size_t>(toInt(param)), 'x') << "\n" << std::flush;
        return 0;
    }
    if (mode == "orphan-stderr") {
        pid_t orphan = ::fork();
        if (orphan < 0) {
            return 3;
        }
        if (orphan == 0) {
            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::dup2(devnull, STDOUT_FILENO);
                ::close(devnull);
            }
            ::sleep(20);
            ::_exit(0);
        }
        {
            std::ofstream out(param != nullptr ? param : "stdio_child.pid");
            out << orphan << "\n";
        }
        const std::string line = readLine();
        std::cout << line << "\n" << std::flush;
        std::cerr << "left a process behind" << std::endl;
        return toInt(argc > 3 ? argv[3] : nullptr);
    }
    std::cerr << "unknown mode: " << mode << std::endl;
    return 2;
}
