#pragma once

// print the trial-level trace of every replication
#ifndef DRUGSIM_DEBUG
#define DRUGSIM_DEBUG 0
#endif

#define LOG_var(x) do { std::cerr <<  "[" << __FILE__ << "][" \
                                << __FUNCTION__ << "][Line " << __LINE__ << "] " \
                                <<#x << ": " << x << std::endl; } while (0)
