export module GraphScale;

// Re-export every stage so hosts only need 'import GraphScale;'
export import Core;
export import :Types;
export import :BarnesHut;
export import :SpatialHash;
export import :Frustum;
export import :LevelOfDetail;
export import :Partitioning;
export import :ChangeTracker;
export import :Config;
