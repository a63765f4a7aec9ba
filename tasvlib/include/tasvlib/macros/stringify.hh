#pragma once

#define STRINGIFY(...) PRIMITIVE_STRINGIFY(__VA_ARGS__)
#define PRIMITIVE_STRINGIFY(...) #__VA_ARGS__

#define REV_CAT(...) PRIMITIVE_REV_CAT(__VA_ARGS__)
#define PRIMITIVE_REV_CAT(b, ...) __VA_ARGS__##b
