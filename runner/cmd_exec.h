#pragma once

// One-shot sandboxed execution of a source file; prints the outcome JSON.
// Usage: codeexec_worker exec <language> <file> [--timeout S]
int cmd_exec(int argc, char** argv);
