#pragma once

#include <gtest/gtest.h>

// Dispatches to standard gtest main function, while adding LoggingUtil and Random cmdline params.
//
// Usage, at the bottom of a test file:
//
// int main(int argc, char** argv) { return launch_gtest(argc, argv); }
int launch_gtest(int argc, char** argv);
