#pragma once

struct Viewer;

void RenderFrame(const Viewer& viewer, float alpha);
