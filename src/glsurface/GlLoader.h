#ifndef GLSURFACE_GLLOADER_H
#define GLSURFACE_GLLOADER_H

// Resolves GL entry points through GLEW for the current context.
// Throws std::runtime_error when GLEW cannot initialize.
void loadGlFunctions();

// Logs GL_VERSION and GL_RENDERER to stdout.
void logGlInfo();

#endif
