#pragma once

// Long-running queue worker. Exit: 0 clean shutdown, 2 fatal config, 3 breaker tripped.
int cmd_worker(int argc, char** argv);

// Load and validate the configuration, print a summary. Exit 0 / 2.
int cmd_check_config(int argc, char** argv);
