#pragma once

// registered format names, one per line
int cmd_formats(int argc, char** argv);

// theme names, one per line (built-ins, then --themes-dir discoveries)
int cmd_themes(int argc, char** argv);
