#pragma once

int cmd_render(int argc, char** argv);
