/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_SHADERSOURCES_H_
#define _CARTO_GPU_SHADERSOURCES_H_

#include <string>

// The sources are written for GLSL ES 3.00 and converted by the assembler when only GLSL ES 1.00 is available.
// Qualifiers 'in' and 'out' are therefore used only for attribute and varying declarations.

namespace carto { namespace gpu {
    static const std::string preludeVsh = R"GLSL(
        #ifdef GL_ES
        precision highp float;
        #else
        #if !defined(lowp)
        #define lowp
        #endif
        #if !defined(mediump)
        #define mediump
        #endif
        #if !defined(highp)
        #define highp
        #endif
        #endif

        #define EXTENT 8192.0

        vec2 unpack_float(const float packedValue) {
            int packedIntValue = int(packedValue);
            int v0 = packedIntValue / 256;
            return vec2(v0, packedIntValue - v0 * 256);
        }

        vec4 decode_color(const vec2 encodedColor) {
            return vec4(unpack_float(encodedColor[0]) / 255.0, unpack_float(encodedColor[1]) / 255.0);
        }

        float unpack_mix_vec2(const vec2 packedValue, const float t) {
            return mix(packedValue[0], packedValue[1], t);
        }

        vec4 unpack_mix_color(const vec4 packedColors, const float t) {
            vec4 minColor = decode_color(vec2(packedColors[0], packedColors[1]));
            vec4 maxColor = decode_color(vec2(packedColors[2], packedColors[3]));
            return mix(minColor, maxColor, t);
        }

        #ifdef TERRAIN3D
        uniform sampler2D u_terrain;
        uniform float u_terrain_dim;
        uniform mat4 u_terrain_matrix;
        uniform vec4 u_terrain_unpack;
        uniform float u_terrain_exaggeration;
        uniform highp sampler2D u_depth;
        #endif

        float ele(vec2 pos) {
        #ifdef TERRAIN3D
            vec4 rgb = (texture(u_terrain, pos) * 255.0) * u_terrain_unpack;
            return rgb.r + rgb.g + rgb.b - u_terrain_unpack.a;
        #else
            return 0.0;
        #endif
        }

        float get_elevation(vec2 pos) {
        #ifdef TERRAIN3D
            vec2 coord = (u_terrain_matrix * vec4(pos, 0.0, 1.0)).xy * u_terrain_dim + 1.0;
            vec2 f = fract(coord);
            vec2 c = (floor(coord) + 0.5) / (u_terrain_dim + 2.0);
            float d = 1.0 / (u_terrain_dim + 2.0);
            float tl = ele(c);
            float tr = ele(c + vec2(d, 0.0));
            float bl = ele(c + vec2(0.0, d));
            float br = ele(c + vec2(d, d));
            float elevation = mix(mix(tl, tr, f.x), mix(bl, br, f.x), f.y);
            return elevation * u_terrain_exaggeration;
        #else
            return 0.0;
        #endif
        }

        float calculate_visibility(vec4 pos) {
        #ifdef TERRAIN3D
            vec3 frag = pos.xyz / pos.w;
            highp vec4 depthColor = texture(u_depth, frag.xy * 0.5 + 0.5);
            highp float depth = dot(depthColor, vec4(1.0, 1.0 / 255.0, 1.0 / 65025.0, 1.0 / 16581375.0));
            return frag.z * 0.5 + 0.5 > depth + 0.0005 ? 0.0 : 1.0;
        #else
            return 1.0;
        #endif
        }
    )GLSL";

    static const std::string preludeFsh = R"GLSL(
        #ifdef GL_ES
        precision mediump float;
        #else
        #if !defined(lowp)
        #define lowp
        #endif
        #if !defined(mediump)
        #define mediump
        #endif
        #if !defined(highp)
        #define highp
        #endif
        #endif

        out highp vec4 fragColor;
    )GLSL";

    static const std::string projectionMercatorVsh = R"GLSL(
        uniform mat4 u_projection_matrix;

        vec4 projectTile(vec2 p) {
            return u_projection_matrix * vec4(p, 0.0, 1.0);
        }

        vec4 projectTileWithElevation(vec2 p, float elevation) {
            return u_projection_matrix * vec4(p, elevation, 1.0);
        }
    )GLSL";

    static const std::string projectionMercatorFsh = R"GLSL(
    )GLSL";

    static const std::string projectionGlobeVsh = R"GLSL(
        #define PI 3.141592653589793
        #define GLOBE_RADIUS 6371008.8

        uniform highp vec4 u_projection_tile_mercator_coords;
        uniform highp vec4 u_projection_clipping_plane;
        uniform highp float u_projection_transition;
        uniform mat4 u_projection_matrix;
        uniform mat4 u_projection_fallback_matrix;

        vec3 projectToSphere(vec2 posInTile) {
            vec2 mercatorPos = u_projection_tile_mercator_coords.xy + u_projection_tile_mercator_coords.zw * posInTile;
            vec2 spherical;
            spherical.x = mercatorPos.x * PI * 2.0 + PI;
            spherical.y = 2.0 * atan(exp(PI - (mercatorPos.y * PI * 2.0))) - PI * 0.5;
            float len = cos(spherical.y);
            return vec3(sin(spherical.x) * len, sin(spherical.y), cos(spherical.x) * len);
        }

        float globeComputeClippingZ(vec3 spherePos) {
            return 1.0 - (dot(spherePos, u_projection_clipping_plane.xyz) + u_projection_clipping_plane.w);
        }

        vec4 interpolateProjection(vec2 posInTile, vec3 spherePos, float elevation) {
            vec3 elevatedPos = spherePos * (1.0 + elevation / GLOBE_RADIUS);
            vec4 globePosition = u_projection_matrix * vec4(elevatedPos, 1.0);
            globePosition.z = globeComputeClippingZ(elevatedPos) * globePosition.w;
            if (u_projection_transition > 0.999) {
                return globePosition;
            }
            vec4 flatPosition = u_projection_fallback_matrix * vec4(posInTile, elevation, 1.0);
            globePosition /= globePosition.w;
            flatPosition /= flatPosition.w;
            return mix(flatPosition, globePosition, u_projection_transition);
        }

        vec4 projectTile(vec2 p) {
            return interpolateProjection(p, projectToSphere(p), 0.0);
        }

        vec4 projectTileWithElevation(vec2 p, float elevation) {
            return interpolateProjection(p, projectToSphere(p), elevation);
        }
    )GLSL";

    static const std::string projectionGlobeFsh = R"GLSL(
    )GLSL";

    static const std::string backgroundVsh = R"GLSL(
        in vec2 a_pos;

        void main() {
            gl_Position = projectTile(a_pos);
        }
    )GLSL";

    static const std::string backgroundFsh = R"GLSL(
        uniform vec4 u_color;
        uniform float u_opacity;

        void main() {
            fragColor = u_color * u_opacity;
        #ifdef OVERDRAW_INSPECTOR
            fragColor = vec4(1.0);
        #endif
        }
    )GLSL";

    static const std::string fillVsh = R"GLSL(
        uniform vec2 u_fill_translate;

        in vec2 a_pos;

        #pragma mapbox: define highp vec4 color
        #pragma mapbox: define lowp float opacity

        void main() {
            #pragma mapbox: initialize highp vec4 color
            #pragma mapbox: initialize lowp float opacity

            vec2 pos = a_pos + u_fill_translate;
            gl_Position = projectTileWithElevation(pos, get_elevation(pos));
        }
    )GLSL";

    static const std::string fillFsh = R"GLSL(
        #pragma mapbox: define highp vec4 color
        #pragma mapbox: define lowp float opacity

        void main() {
            #pragma mapbox: initialize highp vec4 color
            #pragma mapbox: initialize lowp float opacity

            fragColor = color * opacity;
        #ifdef OVERDRAW_INSPECTOR
            fragColor = vec4(1.0);
        #endif
        }
    )GLSL";

    static const std::string lineVsh = R"GLSL(
        uniform float u_ratio;
        uniform lowp float u_device_pixel_ratio;

        in vec2 a_pos;
        in vec2 a_extrude;

        out vec2 v_normal;
        out highp float v_linewidth;
        out float v_visibility;

        #pragma mapbox: define highp vec4 color
        #pragma mapbox: define lowp float opacity
        #pragma mapbox: define mediump float width

        void main() {
            #pragma mapbox: initialize highp vec4 color
            #pragma mapbox: initialize lowp float opacity
            #pragma mapbox: initialize mediump float width

            float antialiasing = 1.0 / u_device_pixel_ratio / 2.0;
            float outset = width / 2.0 + antialiasing;
            vec2 pos = a_pos + a_extrude * outset / u_ratio;
            gl_Position = projectTileWithElevation(pos, get_elevation(a_pos));

            v_normal = a_extrude;
            v_linewidth = outset;
            v_visibility = calculate_visibility(gl_Position);
        }
    )GLSL";

    static const std::string lineFsh = R"GLSL(
        uniform lowp float u_device_pixel_ratio;

        in vec2 v_normal;
        in highp float v_linewidth;
        in float v_visibility;

        #pragma mapbox: define highp vec4 color
        #pragma mapbox: define lowp float opacity

        void main() {
            #pragma mapbox: initialize highp vec4 color
            #pragma mapbox: initialize lowp float opacity

            float blur = 1.0 / u_device_pixel_ratio;
            float dist = length(v_normal) * v_linewidth;
            float alpha = clamp((v_linewidth - dist) / blur, 0.0, 1.0);
            fragColor = color * (alpha * opacity * v_visibility);
        #ifdef OVERDRAW_INSPECTOR
            fragColor = vec4(1.0);
        #endif
        }
    )GLSL";
} }

#endif
