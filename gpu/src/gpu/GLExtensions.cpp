#include "GLExtensions.h"

#include <EGL/egl.h>

namespace carto::gpu {
    GLExtensions::GLExtensions() {
        const char* version = reinterpret_cast<const char*>(glGetString(GL_VERSION));
        if (version) {
            _GLES3_supported = std::string(version).compare(0, 12, "OpenGL ES 3.") == 0;
        }

        std::string paddedExtensions;
        const char* extensions = reinterpret_cast<const char*>(glGetString(GL_EXTENSIONS));
        if (extensions) {
            paddedExtensions = " " + std::string(extensions) + " ";
        }

#ifdef GL_OES_vertex_array_object
        if (!_GLES3_supported) {
#ifdef __ANDROID__
            _GL_OES_vertex_array_object_supported = false; // several Android drivers report the extension but ship a broken implementation
#else
            _GL_OES_vertex_array_object_supported = paddedExtensions.find(" GL_OES_vertex_array_object ") != std::string::npos;
#endif
            if (_GL_OES_vertex_array_object_supported) {
                _glBindVertexArrayOES = reinterpret_cast<PFNGLBINDVERTEXARRAYOESPROC>(eglGetProcAddress("glBindVertexArrayOES"));
                _glDeleteVertexArraysOES = reinterpret_cast<PFNGLDELETEVERTEXARRAYSOESPROC>(eglGetProcAddress("glDeleteVertexArraysOES"));
                _glGenVertexArraysOES = reinterpret_cast<PFNGLGENVERTEXARRAYSOESPROC>(eglGetProcAddress("glGenVertexArraysOES"));
                _GL_OES_vertex_array_object_supported = _glBindVertexArrayOES && _glDeleteVertexArraysOES && _glGenVertexArraysOES;
            }
        }
#endif

#ifdef GL_EXT_robustness
        _GL_EXT_robustness_supported = paddedExtensions.find(" GL_EXT_robustness ") != std::string::npos;
        if (_GL_EXT_robustness_supported) {
            _glGetGraphicsResetStatusEXT = reinterpret_cast<PFNGLGETGRAPHICSRESETSTATUSEXTPROC>(eglGetProcAddress("glGetGraphicsResetStatusEXT"));
            _GL_EXT_robustness_supported = _glGetGraphicsResetStatusEXT != nullptr;
        }
#endif
    }

    void GLExtensions::glBindVertexArrayOES(GLuint array) {
#ifdef GL_OES_vertex_array_object
        _glBindVertexArrayOES(array);
#endif
    }

    void GLExtensions::glDeleteVertexArraysOES(GLsizei n, const GLuint* arrays) {
#ifdef GL_OES_vertex_array_object
        _glDeleteVertexArraysOES(n, arrays);
#endif
    }

    void GLExtensions::glGenVertexArraysOES(GLsizei n, GLuint* arrays) {
#ifdef GL_OES_vertex_array_object
        _glGenVertexArraysOES(n, arrays);
#endif
    }

    GLenum GLExtensions::glGetGraphicsResetStatusEXT() {
#ifdef GL_EXT_robustness
        if (_glGetGraphicsResetStatusEXT) {
            return _glGetGraphicsResetStatusEXT();
        }
#endif
        return GL_NO_ERROR;
    }
}
