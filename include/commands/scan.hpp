#pragma once

// flagscrub scan: sanitize a flag payload from a file or stdin
int cmd_scan(int argc, char** argv);
