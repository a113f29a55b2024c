// commands.h
// MIT License (c) 2026 Pedro

#pragma once

int run_mockgen(int argc, char** argv);
int run_mockzip(int argc, char** argv);
