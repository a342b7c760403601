// miniaudio 为单头文件库：实现部分只在此编译单元展开
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
