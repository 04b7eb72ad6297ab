#pragma once

// flagscrub policy dump: print the effective policy as JSON
int cmd_policy(int argc, char** argv);
