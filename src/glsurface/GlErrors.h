#ifndef GLSURFACE_GLERRORS_H
#define GLSURFACE_GLERRORS_H

#include <GL/glew.h>

#include <string>
#include <vector>

const char* glErrorName(GLenum error);

// Pops every pending error flag. Requires a current context.
std::vector<GLenum> drainGlErrors();

// Logs each pending error under `stage` and throws std::runtime_error if there was any.
void checkGlErrors(const std::string& stage);

#endif
