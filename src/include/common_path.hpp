#pragma once

// Common path
#define ROOT									"/opt/face_attendance/"
#define ASSERT									ROOT "assert/"


// Detector
#define YNMODEL_PATH							ASSERT "models/face/"
#define YNMODEL									"face_detection_yunet_2023mar.onnx"


// Embedding related paths
#define SFACE_RECOGNIZER_PATH					ASSERT "models/face/"
#define SFACE_RECOGNIZER						"face_recognition_sface_2021dec.onnx"

// Liveness depth (face mesh 468pt)
#define FACEMESH_PATH							ASSERT "models/face/"
#define FACEMESH								"face_mesh_192x192.onnx"

#define GALLERY_JSON_PATH						ASSERT "gallery/"
#define GALLERY_JSON							"gallery.json"


// Sqlite DB
#define DB_PATH                            		ASSERT "db/"
#define DB                                  	"attendance.db"

// Config
#define CONFIG_PATH								ROOT "config/"
#define CONFIG_JSON								"attendance.json"

// Text log
#define LOG_DIR									"/var/log/face_attendance"
