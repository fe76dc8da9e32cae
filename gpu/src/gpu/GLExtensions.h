/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_GLEXTENSIONS_H_
#define _CARTO_GPU_GLEXTENSIONS_H_

#include <string>

#include <GLES3/gl3.h>
#include <GLES2/gl2ext.h>

namespace carto { namespace gpu {
    class GLExtensions final {
    public:
        GLExtensions();

        bool GLES3_supported() const { return _GLES3_supported; }
        bool GL_OES_vertex_array_object_supported() const { return _GL_OES_vertex_array_object_supported; }
        bool GL_EXT_robustness_supported() const { return _GL_EXT_robustness_supported; }

        void glBindVertexArrayOES(GLuint array);
        void glDeleteVertexArraysOES(GLsizei n, const GLuint* arrays);
        void glGenVertexArraysOES(GLsizei n, GLuint* arrays);

        GLenum glGetGraphicsResetStatusEXT();

    private:
        bool _GLES3_supported = false;
        bool _GL_OES_vertex_array_object_supported = false;
        bool _GL_EXT_robustness_supported = false;

#ifdef GL_OES_vertex_array_object
        PFNGLBINDVERTEXARRAYOESPROC _glBindVertexArrayOES = nullptr;
        PFNGLDELETEVERTEXARRAYSOESPROC _glDeleteVertexArraysOES = nullptr;
        PFNGLGENVERTEXARRAYSOESPROC _glGenVertexArraysOES = nullptr;
#endif
#ifdef GL_EXT_robustness
        PFNGLGETGRAPHICSRESETSTATUSEXTPROC _glGetGraphicsResetStatusEXT = nullptr;
#endif
    };
} }

#endif
